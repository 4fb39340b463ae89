#include "mcplink/transport/http_types.hpp"

#include <ada.h>

#include <charconv>

namespace mcplink {

namespace {

std::string scheme_of(const ada::url_aggregator& url) {
    // ada reports the protocol with its trailing colon ("https:")
    std::string scheme(url.get_protocol());
    const bool has_colon = (scheme.empty() == false) && (scheme.back() == ':');
    if (has_colon) {
        scheme.pop_back();
    }
    return scheme;
}

bool is_http_scheme(std::string_view scheme) {
    return (scheme == "http") || (scheme == "https");
}

}  // namespace

std::optional<UrlComponents> parse_url(std::string_view url) {
    auto parsed = ada::parse<ada::url_aggregator>(url);
    const bool parse_failed = (parsed.has_value() == false);
    if (parse_failed) {
        return std::nullopt;
    }
    const auto& ada_url = parsed.value();

    std::string scheme = scheme_of(ada_url);
    if (is_http_scheme(scheme) == false) {
        return std::nullopt;
    }

    std::string host(ada_url.get_hostname());
    if (host.empty()) {
        return std::nullopt;
    }

    std::uint16_t port = (scheme == "https") ? 443 : 80;
    const auto port_text = ada_url.get_port();
    if (port_text.empty() == false) {
        const auto [ptr, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
        if (ec != std::errc{}) {
            return std::nullopt;
        }
    }

    std::string path(ada_url.get_pathname());
    if (path.empty()) {
        path = "/";
    }

    UrlComponents result;
    result.href = std::string(ada_url.get_href());
    result.scheme = std::move(scheme);
    result.host = std::move(host);
    result.port = port;
    result.path = std::move(path);
    result.query = std::string(ada_url.get_search());
    return result;
}

std::optional<std::string> resolve_url(std::string_view base, std::string_view reference) {
    auto base_url = ada::parse<ada::url_aggregator>(base);
    if (!base_url) {
        return std::nullopt;
    }

    auto resolved = ada::parse<ada::url_aggregator>(reference, &base_url.value());
    if (!resolved) {
        return std::nullopt;
    }
    if (is_http_scheme(scheme_of(resolved.value())) == false) {
        return std::nullopt;
    }
    return std::string(resolved->get_href());
}

}  // namespace mcplink
