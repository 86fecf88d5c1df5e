#include <ghmcp/core/signal_watcher.hpp>

#include <ghmcp/core/log.hpp>

#include <string>

#include <pthread.h>

namespace ghmcp {

namespace {

constexpr int kWakeSignal = SIGUSR1;

} // anonymous namespace

SignalWatcher::SignalWatcher(Callback on_signal)
    : on_signal_(std::move(on_signal)) {
    sigemptyset(&signals_);
    sigaddset(&signals_, SIGINT);
    sigaddset(&signals_, SIGTERM);
    sigaddset(&signals_, kWakeSignal);
    pthread_sigmask(SIG_BLOCK, &signals_, &previous_mask_);
    thread_ = std::thread([this]() { Run(); });
}

SignalWatcher::~SignalWatcher() {
    stopping_ = true;
    if (!finished_) {
        pthread_kill(thread_.native_handle(), kWakeSignal);
    }
    thread_.join();
    pthread_sigmask(SIG_SETMASK, &previous_mask_, nullptr);
}

void SignalWatcher::Run() {
    for (;;) {
        int sig = 0;
        if (sigwait(&signals_, &sig) != 0) {
            LogError("signal", "sigwait failed");
            break;
        }
        if (sig == kWakeSignal) {
            if (stopping_) {
                break;
            }
            continue;
        }
        LogInfo("signal", "received signal", {{"signal", std::to_string(sig)}});
        if (on_signal_) {
            on_signal_(sig);
        }
        break;
    }
    finished_ = true;
}

} // namespace ghmcp
