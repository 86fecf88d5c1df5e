#pragma once

#include <ghmcp/core/log.hpp>

#include <mutex>
#include <string>
#include <vector>

namespace ghmcp {
namespace testing {

struct CapturedMessage {
    LogLevel level;
    std::string component;
    std::string message;
    LogFields fields;

    // Value of a field, or "" when absent.
    [[nodiscard]] std::string Field(const std::string& key) const {
        for (const auto& [k, v] : fields) {
            if (k == key) return v;
        }
        return "";
    }
};

// Sink that captures records into a vector. The Logger serializes writes,
// but tests read `messages` from other threads, hence the lock.
class CaptureSink : public ILogSink {
public:
    void Write(LogLevel level, std::string_view component,
               std::string_view message, const LogFields& fields) override {
        std::lock_guard<std::mutex> lock(mutex_);
        messages_.push_back(
            {level, std::string(component), std::string(message), fields});
    }

    [[nodiscard]] std::vector<CapturedMessage> Messages() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_;
    }

    void Clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        messages_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::vector<CapturedMessage> messages_;
};

} // namespace testing
} // namespace ghmcp
