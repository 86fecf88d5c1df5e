#include <ghmcp/core/url.hpp>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace ghmcp {

namespace {

Error MakeUrlError(std::string_view url, const std::string& message) {
    return Error{"ParseUrl", std::string(url), std::nullopt, message,
                 std::nullopt, ErrorCategory::Config, std::nullopt};
}

std::string ToLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // anonymous namespace

std::string UrlEncode(const std::string& value) {
    std::ostringstream encoded;
    encoded.fill('0');
    encoded << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return encoded.str();
}

std::string UrlEncodePath(const std::string& path) {
    std::string out;
    std::size_t start = 0;
    while (true) {
        auto slash = path.find('/', start);
        out += UrlEncode(path.substr(start, slash - start));
        if (slash == std::string::npos) break;
        out += '/';
        start = slash + 1;
    }
    return out;
}

std::string ParsedUrl::Origin() const {
    std::string origin = scheme + "://" + host;
    if (port.has_value()) {
        origin += ":" + std::to_string(*port);
    }
    return origin;
}

Result<ParsedUrl, Error> ParseUrl(std::string_view url) {
    auto sep = url.find("://");
    if (sep == std::string_view::npos || sep == 0) {
        return Result<ParsedUrl, Error>::Err(MakeUrlError(url, "missing scheme"));
    }

    ParsedUrl parsed;
    parsed.scheme = ToLower(url.substr(0, sep));
    if (parsed.scheme != "http" && parsed.scheme != "https") {
        return Result<ParsedUrl, Error>::Err(
            MakeUrlError(url, "unsupported scheme '" + parsed.scheme + "'"));
    }

    auto rest = url.substr(sep + 3);
    auto path_pos = rest.find_first_of("/?#");
    auto authority = rest.substr(0, path_pos);
    if (path_pos != std::string_view::npos) {
        auto tail = rest.substr(path_pos);
        auto hash = tail.find('#');
        tail = tail.substr(0, hash);
        parsed.path = (tail.empty() || tail[0] != '/') ? "/" + std::string(tail)
                                                       : std::string(tail);
    }

    // Drop userinfo, if any.
    auto at = authority.rfind('@');
    if (at != std::string_view::npos) {
        authority = authority.substr(at + 1);
    }

    auto colon = authority.rfind(':');
    if (colon != std::string_view::npos) {
        auto port_str = authority.substr(colon + 1);
        if (port_str.empty() ||
            !std::all_of(port_str.begin(), port_str.end(),
                         [](unsigned char c) { return std::isdigit(c); }) ||
            port_str.size() > 5) {
            return Result<ParsedUrl, Error>::Err(MakeUrlError(url, "invalid port"));
        }
        auto port = std::stoi(std::string(port_str));
        if (port <= 0 || port > 65535) {
            return Result<ParsedUrl, Error>::Err(MakeUrlError(url, "invalid port"));
        }
        parsed.port = static_cast<uint16_t>(port);
        authority = authority.substr(0, colon);
    }

    if (authority.empty()) {
        return Result<ParsedUrl, Error>::Err(MakeUrlError(url, "missing host"));
    }
    parsed.host = ToLower(authority);
    return Result<ParsedUrl, Error>::Ok(std::move(parsed));
}

} // namespace ghmcp
