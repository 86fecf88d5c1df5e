#include <catch2/catch_test_macros.hpp>

#include <ghmcp/core/url.hpp>

using namespace ghmcp;

TEST_CASE("UrlEncode: unreserved characters pass through", "[url]") {
    CHECK(UrlEncode("abc-XYZ_0.9~") == "abc-XYZ_0.9~");
}

TEST_CASE("UrlEncode: reserved characters are percent-encoded", "[url]") {
    CHECK(UrlEncode("a b/c") == "a%20b%2Fc");
    CHECK(UrlEncode("#?&") == "%23%3F%26");
}

TEST_CASE("UrlEncodePath: keeps slashes between segments", "[url]") {
    CHECK(UrlEncodePath("docs/read me.md") == "docs/read%20me.md");
    CHECK(UrlEncodePath("feature/x#1") == "feature/x%231");
    CHECK(UrlEncodePath("") == "");
}

TEST_CASE("ParseUrl: full URL", "[url]") {
    auto r = ParseUrl("HTTPS://GHES.Example.com:8443/api/v3/?q=1#frag");
    REQUIRE(r.IsOk());
    const auto& u = r.Value();
    CHECK(u.scheme == "https");
    CHECK(u.host == "ghes.example.com");
    REQUIRE(u.port.has_value());
    CHECK(*u.port == 8443);
    CHECK(u.path == "/api/v3/?q=1");
    CHECK(u.Origin() == "https://ghes.example.com:8443");
}

TEST_CASE("ParseUrl: host only gets root path", "[url]") {
    auto r = ParseUrl("http://raw.example.com");
    REQUIRE(r.IsOk());
    CHECK(r.Value().path == "/");
    CHECK_FALSE(r.Value().port.has_value());
    CHECK(r.Value().Origin() == "http://raw.example.com");
}

TEST_CASE("ParseUrl: rejects bad input", "[url]") {
    CHECK(ParseUrl("example.com").IsErr());
    CHECK(ParseUrl("ftp://example.com").IsErr());
    CHECK(ParseUrl("https://").IsErr());
    CHECK(ParseUrl("https://host:99999").IsErr());
    CHECK(ParseUrl("https://host:").IsErr());

    auto r = ParseUrl("ftp://example.com");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Config);
}
