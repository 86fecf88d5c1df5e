#pragma once

#include <atomic>
#include <functional>
#include <thread>

#include <signal.h>

namespace ghmcp {

// ---------------------------------------------------------------------------
// SignalWatcher: delivers SIGINT/SIGTERM to a callback on its own thread.
//
// The constructor blocks SIGINT, SIGTERM and SIGUSR1 in the calling thread,
// so it must run before any other thread is started; threads created later
// inherit the mask. The watcher thread waits with sigwait() and calls
// `on_signal` once, for the first SIGINT or SIGTERM, then exits.
//
// The destructor wakes the thread with SIGUSR1 if it is still waiting,
// joins it and restores the previous signal mask. Anything the callback
// references only has to outlive the SignalWatcher.
// ---------------------------------------------------------------------------
class SignalWatcher {
public:
    using Callback = std::function<void(int signal_number)>;

    explicit SignalWatcher(Callback on_signal);
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

private:
    void Run();

    Callback on_signal_;
    sigset_t signals_;
    sigset_t previous_mask_;
    std::atomic<bool> stopping_{false};
    std::atomic<bool> finished_{false};
    std::thread thread_;
};

} // namespace ghmcp
