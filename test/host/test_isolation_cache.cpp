#include <catch2/catch_test_macros.hpp>

#include <ghmcp/host/isolation_cache.hpp>

#include "mocks/mock_http_client.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace ghmcp;
using ghmcp::testing::MockHttpClient;

TEST_CASE("IsolationProbeUrl: prefixes raw. and appends /_ping", "[isolation]") {
    CHECK(IsolationProbeUrl("https", "test.ghes.com") == "https://raw.test.ghes.com/_ping");
    CHECK(IsolationProbeUrl("http", "ghes.local:8080") == "http://raw.ghes.local:8080/_ping");
    CHECK(IsolationCacheKey("https", "test.ghes.com") == "https://test.ghes.com");
}

TEST_CASE("ProbeSubdomainIsolation: 2xx means isolated", "[isolation]") {
    MockHttpClient mock;
    mock.EnqueueGet(MockHttpClient::Status(200));
    mock.EnqueueGet(MockHttpClient::Status(204));
    CHECK(ProbeSubdomainIsolation(mock, "https", "a.example"));
    CHECK(ProbeSubdomainIsolation(mock, "https", "a.example"));
}

TEST_CASE("ProbeSubdomainIsolation: other statuses mean not isolated", "[isolation]") {
    MockHttpClient mock;
    for (int code : {301, 404, 500, 503}) {
        mock.EnqueueGet(MockHttpClient::Status(code));
        CHECK_FALSE(ProbeSubdomainIsolation(mock, "https", "a.example"));
    }
}

TEST_CASE("ProbeSubdomainIsolation: transport failure means not isolated", "[isolation]") {
    MockHttpClient mock;
    mock.EnqueueGet(MockHttpClient::TransportFailure());
    CHECK_FALSE(ProbeSubdomainIsolation(mock, "https", "a.example"));
}

TEST_CASE("SubdomainIsolationCache: probes once per host", "[isolation]") {
    MockHttpClient mock;
    SubdomainIsolationCache cache;

    for (int i = 0; i < 5; ++i) {
        CHECK(cache.Check(mock, "https", "test.ghes.com"));
    }

    REQUIRE(mock.GetCallCount() == 1);
    CHECK(mock.GetCalls()[0] == "https://raw.test.ghes.com/_ping");
    CHECK(cache.Size() == 1);
}

TEST_CASE("SubdomainIsolationCache: hosts are cached independently", "[isolation]") {
    MockHttpClient mock;
    mock.EnqueueGet(MockHttpClient::Status(200));
    mock.EnqueueGet(MockHttpClient::Status(404));
    SubdomainIsolationCache cache;

    CHECK(cache.Check(mock, "https", "one.example"));
    CHECK_FALSE(cache.Check(mock, "https", "two.example"));
    CHECK(cache.Check(mock, "https", "one.example"));
    CHECK_FALSE(cache.Check(mock, "https", "two.example"));

    CHECK(mock.GetCallCount() == 2);
    CHECK(cache.Size() == 2);
}

TEST_CASE("SubdomainIsolationCache: scheme is part of the key", "[isolation]") {
    MockHttpClient mock;
    SubdomainIsolationCache cache;

    (void)cache.Check(mock, "https", "ghes.local");
    (void)cache.Check(mock, "http", "ghes.local");

    CHECK(mock.GetCallCount() == 2);
    CHECK(cache.Lookup("https://ghes.local").has_value());
    CHECK(cache.Lookup("http://ghes.local").has_value());
}

TEST_CASE("SubdomainIsolationCache: failed probe is cached as false", "[isolation]") {
    MockHttpClient mock;
    mock.EnqueueGet(MockHttpClient::TransportFailure());
    SubdomainIsolationCache cache;

    CHECK_FALSE(cache.Check(mock, "https", "down.example"));
    // Queue is empty now; a second probe would answer 200.
    CHECK_FALSE(cache.Check(mock, "https", "down.example"));
    CHECK(mock.GetCallCount() == 1);

    auto stored = cache.Lookup("https://down.example");
    REQUIRE(stored.has_value());
    CHECK_FALSE(*stored);
}

TEST_CASE("SubdomainIsolationCache: Lookup does not probe", "[isolation]") {
    MockHttpClient mock;
    SubdomainIsolationCache cache;

    CHECK_FALSE(cache.Lookup("https://never.example").has_value());
    CHECK(cache.Size() == 0);
    CHECK(mock.GetCallCount() == 0);
}

TEST_CASE("SubdomainIsolationCache: concurrent callers agree", "[isolation]") {
    MockHttpClient mock;
    SubdomainIsolationCache cache;

    constexpr int kThreads = 8;
    std::atomic<int> isolated{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&]() {
            if (cache.Check(mock, "https", "busy.example")) {
                ++isolated;
            }
        });
    }
    for (auto& t : threads) t.join();

    CHECK(isolated.load() == kThreads);
    CHECK(cache.Size() == 1);
    // Cold-key races may probe more than once, never more than once per caller.
    CHECK(mock.GetCallCount() >= 1);
    CHECK(mock.GetCallCount() <= static_cast<size_t>(kThreads));

    auto before = mock.GetCallCount();
    CHECK(cache.Check(mock, "https", "busy.example"));
    CHECK(mock.GetCallCount() == before);
}
