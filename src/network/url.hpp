#pragma once

#include "core/status.hpp"
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace prism::network {

/// Host, port and path prefix of a venue base URL
struct Endpoint {
    std::string host;         // e.g. "www.okx.com"
    std::string port = "443";
    std::string base_path;    // prefix without trailing slash, usually empty

    /// "https://host[:port]" for log lines
    [[nodiscard]] std::string origin() const;
};

/// Parse a base URL such as "https://www.okx.com" or "https://host:8443/prefix"
/// Only the https scheme is accepted
[[nodiscard]] Result<Endpoint, std::string> parse_base_url(std::string_view url);

using QueryParam = std::pair<std::string_view, std::string_view>;

/// Build "path?k1=v1&k2=v2" with percent-encoded keys and values
[[nodiscard]] std::string build_target(std::string_view path,
                                       std::initializer_list<QueryParam> params);

/// Percent-encode everything outside the RFC 3986 unreserved set
[[nodiscard]] std::string percent_encode(std::string_view value);

/// Decode %XX escapes and '+' as space; malformed escapes are kept verbatim
[[nodiscard]] std::string percent_decode(std::string_view value);

/// Origin-form request target split into path and decoded query parameters
struct RequestTarget {
    std::string path;
    std::map<std::string, std::string> params;  // last occurrence wins

    /// Parameter value, or nullopt when missing or empty
    [[nodiscard]] std::optional<std::string> param(const std::string& key) const;
};

[[nodiscard]] RequestTarget parse_target(std::string_view target);

}  // namespace prism::network
