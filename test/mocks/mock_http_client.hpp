#pragma once

#include <ghmcp/http/http_client.hpp>

#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace ghmcp {
namespace testing {

// ---------------------------------------------------------------------------
// MockHttpClient: hand-written mock for offline unit testing.
//
// Usage:
//   MockHttpClient mock;
//   mock.EnqueueGet(Result<HttpResponse, Error>::Ok({200, {}, ""}));
//   auto result = mock.Get("https://raw.example.com/_ping");
//   CHECK(mock.GetCallCount() == 1);
//
// Queued responses are consumed FIFO. With an empty queue the default
// response (200 OK unless changed with SetDefault) is returned. A handler
// installed with SetHandler takes precedence over both. Thread-safe.
// ---------------------------------------------------------------------------
class MockHttpClient : public IHttpClient {
public:
    using Handler = std::function<Result<HttpResponse, Error>(const std::string& url)>;

    MockHttpClient() = default;

    void EnqueueGet(Result<HttpResponse, Error> response) {
        std::lock_guard<std::mutex> lock(mutex_);
        responses_.push_back(std::move(response));
    }

    void SetDefault(Result<HttpResponse, Error> response) {
        std::lock_guard<std::mutex> lock(mutex_);
        default_ = std::move(response);
    }

    void SetHandler(Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = std::move(handler);
    }

    [[nodiscard]] std::vector<std::string> GetCalls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    [[nodiscard]] size_t GetCallCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_.size();
    }

    Result<HttpResponse, Error> Get(std::string_view url,
                                    const HttpHeaders& /*headers*/ = {}) override {
        Handler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.emplace_back(url);
            if (!handler_) {
                if (responses_.empty()) {
                    return default_;
                }
                auto response = std::move(responses_.front());
                responses_.pop_front();
                return response;
            }
            handler = handler_;
        }
        return handler(std::string(url));
    }

    static Result<HttpResponse, Error> Status(int code) {
        return Result<HttpResponse, Error>::Ok(HttpResponse{code, {}, ""});
    }

    static Result<HttpResponse, Error> TransportFailure() {
        return Result<HttpResponse, Error>::Err(Error{
            "MockHttpClient::Get", "", std::nullopt, "connection refused",
            std::nullopt, ErrorCategory::Connection, std::nullopt});
    }

private:
    mutable std::mutex mutex_;
    std::deque<Result<HttpResponse, Error>> responses_;
    Result<HttpResponse, Error> default_ = Status(200);
    Handler handler_;
    std::vector<std::string> calls_;
};

} // namespace testing
} // namespace ghmcp
