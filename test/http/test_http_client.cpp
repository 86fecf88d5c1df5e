#include <catch2/catch_test_macros.hpp>

#include <ghmcp/http/http_client.hpp>

#include <chrono>

using namespace ghmcp;

// These tests never leave the machine: they cover URL rejection and a
// refused loopback connection.

TEST_CASE("HttpClient: rejects a URL without a scheme", "[http]") {
    HttpClient client;
    auto r = client.Get("raw.example.com/_ping");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Config);
}

TEST_CASE("HttpClient: rejects an unsupported scheme", "[http]") {
    HttpClient client;
    auto r = client.Get("ftp://raw.example.com/_ping");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Config);
}

TEST_CASE("HttpClient: refused connection is a transport error", "[http]") {
    HttpClientOptions options;
    options.connect_timeout = std::chrono::seconds(1);
    options.read_timeout = std::chrono::seconds(1);
    HttpClient client(options);

    // Port 1 (tcpmux) has no listener on a normal host.
    auto r = client.Get("http://127.0.0.1:1/_ping");
    REQUIRE(r.IsErr());
    CHECK((r.Error().category == ErrorCategory::Connection ||
           r.Error().category == ErrorCategory::Timeout));
    CHECK(r.Error().endpoint == "http://127.0.0.1:1/_ping");
    CHECK_FALSE(r.Error().http_status.has_value());
}

TEST_CASE("HttpResponse: IsSuccess covers 2xx only", "[http]") {
    HttpResponse r;
    r.status_code = 200;
    CHECK(r.IsSuccess());
    r.status_code = 204;
    CHECK(r.IsSuccess());
    r.status_code = 301;
    CHECK_FALSE(r.IsSuccess());
    r.status_code = 404;
    CHECK_FALSE(r.IsSuccess());
    r.status_code = 0;
    CHECK_FALSE(r.IsSuccess());
}
