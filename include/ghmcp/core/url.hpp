#pragma once

#include <ghmcp/core/result.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ghmcp {

// Percent-encode a string per RFC 3986.
// Unreserved characters (alphanumeric, '-', '_', '.', '~') pass through;
// everything else is replaced with %XX (uppercase hex).
std::string UrlEncode(const std::string& value);

// Percent-encode each '/'-separated segment of a path, keeping the slashes.
std::string UrlEncodePath(const std::string& path);

// ---------------------------------------------------------------------------
// ParsedUrl: the pieces of an absolute http(s) URL.
// ---------------------------------------------------------------------------
struct ParsedUrl {
    std::string scheme;            // lower-case, "http" or "https"
    std::string host;              // lower-case hostname, no port
    std::optional<uint16_t> port;  // explicit port only
    std::string path = "/";        // path plus query, always starts with '/'

    /// scheme://host[:port]
    [[nodiscard]] std::string Origin() const;
};

/// Parse "scheme://host[:port][/path]". Only http and https are accepted.
Result<ParsedUrl, Error> ParseUrl(std::string_view url);

} // namespace ghmcp
