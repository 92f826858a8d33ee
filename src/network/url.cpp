#include "network/url.hpp"
#include "core/text.hpp"
#include <cctype>

namespace prism::network {

namespace {

constexpr std::string_view kHttpsScheme = "https://";
constexpr char kHexDigits[] = "0123456789ABCDEF";

bool is_unreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~';
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool is_valid_port(std::string_view port) {
    if (port.empty() || port.size() > 5) {
        return false;
    }
    unsigned value = 0;
    for (char c : port) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 10 + static_cast<unsigned>(c - '0');
    }
    return value > 0 && value <= 65535;
}

}  // namespace

std::string Endpoint::origin() const {
    std::string result = "https://" + host;
    if (port != "443") {
        result += ":" + port;
    }
    return result;
}

Result<Endpoint, std::string> parse_base_url(std::string_view url) {
    url = text::trim(url);
    if (text::to_lowercase(url.substr(0, kHttpsScheme.size())) != kHttpsScheme) {
        return Result<Endpoint, std::string>::Err(
            "base URL must start with https://: '" + std::string(url) + "'");
    }
    url.remove_prefix(kHttpsScheme.size());

    std::string_view authority = url;
    std::string_view path;
    if (auto slash = url.find('/'); slash != std::string_view::npos) {
        authority = url.substr(0, slash);
        path = url.substr(slash);
    }

    Endpoint endpoint;
    if (auto colon = authority.rfind(':'); colon != std::string_view::npos) {
        auto port = authority.substr(colon + 1);
        if (!is_valid_port(port)) {
            return Result<Endpoint, std::string>::Err(
                "invalid port in base URL: '" + std::string(port) + "'");
        }
        endpoint.port = std::string(port);
        authority = authority.substr(0, colon);
    }
    if (authority.empty()) {
        return Result<Endpoint, std::string>::Err("base URL has no host");
    }
    endpoint.host = std::string(authority);

    while (!path.empty() && path.back() == '/') {
        path.remove_suffix(1);
    }
    endpoint.base_path = std::string(path);

    return Result<Endpoint, std::string>::Ok(std::move(endpoint));
}

std::string percent_encode(std::string_view value) {
    std::string result;
    result.reserve(value.size());
    for (char c : value) {
        auto uc = static_cast<unsigned char>(c);
        if (is_unreserved(uc)) {
            result += c;
        } else {
            result += '%';
            result += kHexDigits[uc >> 4];
            result += kHexDigits[uc & 0x0F];
        }
    }
    return result;
}

std::string percent_decode(std::string_view value) {
    std::string result;
    result.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '+') {
            result += ' ';
        } else if (c == '%' && i + 2 < value.size()) {
            int hi = hex_value(value[i + 1]);
            int lo = hex_value(value[i + 2]);
            if (hi < 0 || lo < 0) {
                result += c;
                continue;
            }
            result += static_cast<char>((hi << 4) | lo);
            i += 2;
        } else {
            result += c;
        }
    }
    return result;
}

std::string build_target(std::string_view path, std::initializer_list<QueryParam> params) {
    std::string target(path);
    char separator = '?';
    for (const auto& [key, value] : params) {
        target += separator;
        target += percent_encode(key);
        target += '=';
        target += percent_encode(value);
        separator = '&';
    }
    return target;
}

std::optional<std::string> RequestTarget::param(const std::string& key) const {
    auto it = params.find(key);
    if (it == params.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second;
}

RequestTarget parse_target(std::string_view target) {
    RequestTarget result;

    std::string_view query;
    if (auto q = target.find('?'); q != std::string_view::npos) {
        query = target.substr(q + 1);
        target = target.substr(0, q);
    }
    if (auto hash = query.find('#'); hash != std::string_view::npos) {
        query = query.substr(0, hash);
    }
    result.path = percent_decode(target);

    while (!query.empty()) {
        std::string_view pair = query;
        if (auto amp = query.find('&'); amp != std::string_view::npos) {
            pair = query.substr(0, amp);
            query.remove_prefix(amp + 1);
        } else {
            query = {};
        }
        if (pair.empty()) {
            continue;
        }

        std::string_view key = pair;
        std::string_view value;
        if (auto eq = pair.find('='); eq != std::string_view::npos) {
            key = pair.substr(0, eq);
            value = pair.substr(eq + 1);
        }
        result.params[percent_decode(key)] = percent_decode(value);
    }

    return result;
}

}  // namespace prism::network
