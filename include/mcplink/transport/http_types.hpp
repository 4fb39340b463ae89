#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <unordered_map>

namespace mcplink {

// ─────────────────────────────────────────────────────────────────────────────
// Headers
// ─────────────────────────────────────────────────────────────────────────────
// Header names are case-insensitive (RFC 9110); lookups must not assume the
// casing a server or proxy chose.

using HeaderMap = std::unordered_map<std::string, std::string>;

inline HeaderMap::const_iterator find_header(
    const HeaderMap& headers,
    std::string_view name
) {
    return std::ranges::find_if(headers,
        [&name](const auto& pair) {
            const auto& key = pair.first;
            return key.size() == name.size() &&
                   std::ranges::equal(key, name,
                       [](char a, char b) {
                           return std::tolower(static_cast<unsigned char>(a)) ==
                                  std::tolower(static_cast<unsigned char>(b));
                       });
        });
}

inline std::optional<std::string> get_header(
    const HeaderMap& headers,
    std::string_view name
) {
    const auto it = find_header(headers, name);
    const bool found = (it != headers.end());
    if (found) {
        return it->second;
    }
    return std::nullopt;
}

/// Insert or replace a header, matching the existing name case-insensitively.
inline void set_header(HeaderMap& headers, std::string_view name, std::string value) {
    const auto it = find_header(headers, name);
    if (it != headers.end()) {
        headers.erase(it);
    }
    headers.emplace(std::string(name), std::move(value));
}

// ─────────────────────────────────────────────────────────────────────────────
// Requests
// ─────────────────────────────────────────────────────────────────────────────

enum class HttpMethod {
    Get,
    Post,
    Delete
};

inline std::string to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:    return "GET";
        case HttpMethod::Post:   return "POST";
        case HttpMethod::Delete: return "DELETE";
    }
    return "UNKNOWN";
}

struct HttpRequest {
    HttpMethod method{HttpMethod::Get};
    std::string url;                  // Absolute URL
    HeaderMap headers;
    std::optional<std::string> body;  // POST only

    HttpRequest& with_header(std::string_view name, std::string value) {
        set_header(headers, name, std::move(value));
        return *this;
    }

    HttpRequest& with_body(std::string content) {
        body = std::move(content);
        return *this;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// URLs (ada-url, WHATWG URL Standard)
// ─────────────────────────────────────────────────────────────────────────────

struct UrlComponents {
    std::string href;     // Normalized full URL
    std::string scheme;   // "http" or "https"
    std::string host;
    std::uint16_t port;   // Explicit port or the scheme default
    std::string path;     // Leading slash included
    std::string query;    // "?a=b" or empty

    [[nodiscard]] bool is_secure() const {
        return scheme == "https";
    }

    [[nodiscard]] std::string path_with_query() const {
        return path + query;
    }
};

/// Parse an absolute http(s) URL. Returns nullopt for anything else.
std::optional<UrlComponents> parse_url(std::string_view url);

/// Resolve `reference` against `base` the way a browser resolves a link:
/// "/msg?x=1" keeps the base origin, an absolute URL replaces it. Returns
/// nullopt when the base is invalid or the result is not http(s).
std::optional<std::string> resolve_url(std::string_view base, std::string_view reference);

}  // namespace mcplink
