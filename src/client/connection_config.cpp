#include "mcplink/client/connection_config.hpp"

#include <fstream>

namespace mcplink {

ConnectionConfig& ConnectionConfig::with_bearer_token(std::string token) {
    bearer_token = std::move(token);
    return *this;
}

ConnectionConfig& ConnectionConfig::with_header(const std::string& name, std::string value) {
    set_header(headers, name, std::move(value));
    return *this;
}

ConnectionConfig& ConnectionConfig::with_request_timeout(std::chrono::milliseconds timeout) {
    request_timeout = timeout;
    return *this;
}

ConnectionConfig& ConnectionConfig::with_reconnect(ReconnectConfig settings) {
    reconnect = settings;
    return *this;
}

tl::expected<void, ConfigError> ConnectionConfig::validate() const {
    if (url.empty()) {
        return tl::unexpected(ConfigError{"url is required"});
    }
    const bool url_ok = parse_url(url).has_value();
    if (url_ok == false) {
        return tl::unexpected(ConfigError{"url must be an absolute http(s) URL: " + url});
    }

    const bool timeouts_positive =
        (request_timeout.count() > 0) &&
        (endpoint_timeout.count() > 0) &&
        (connect_timeout.count() > 0);
    if (timeouts_positive == false) {
        return tl::unexpected(ConfigError{"timeouts must be positive"});
    }

    if (reconnect.multiplier < 1.0) {
        return tl::unexpected(ConfigError{"reconnect.multiplier must be >= 1"});
    }
    if (reconnect.min_delay.count() < 0 || reconnect.max_delay < reconnect.min_delay) {
        return tl::unexpected(ConfigError{"reconnect delays must satisfy 0 <= minDelay <= maxDelay"});
    }
    if (session_header_names.empty()) {
        return tl::unexpected(ConfigError{"at least one session header name is required"});
    }
    return {};
}

// ─────────────────────────────────────────────────────────────────────────────
// Loading
// ─────────────────────────────────────────────────────────────────────────────

namespace {

std::optional<std::chrono::milliseconds> read_millis(const Json& node, const char* key) {
    const auto it = node.find(key);
    if (it == node.end() || it->is_number_integer() == false) {
        return std::nullopt;
    }
    return std::chrono::milliseconds{it->get<std::int64_t>()};
}

bool has_type(const Json& value, Json::value_t type) {
    switch (type) {
        case Json::value_t::number_integer: return value.is_number_integer();
        case Json::value_t::number_float:   return value.is_number();
        default:                            return value.type() == type;
    }
}

tl::expected<void, ConfigError> expect_type(const Json& node, const char* key, Json::value_t type) {
    const auto it = node.find(key);
    const bool present = (it != node.end());
    if (present && has_type(*it, type) == false) {
        return tl::unexpected(ConfigError{std::string("wrong type for '") + key + "'"});
    }
    return {};
}

}  // namespace

tl::expected<ConnectionConfig, ConfigError> load_connection_config(const Json& document) {
    if (document.is_object() == false) {
        return tl::unexpected(ConfigError{"configuration must be a JSON object"});
    }

    const std::pair<const char*, Json::value_t> typed_keys[] = {
        {"serverId", Json::value_t::string},
        {"url", Json::value_t::string},
        {"token", Json::value_t::string},
        {"headers", Json::value_t::object},
        {"requestTimeoutMs", Json::value_t::number_integer},
        {"endpointTimeoutMs", Json::value_t::number_integer},
        {"connectTimeoutMs", Json::value_t::number_integer},
        {"reconnect", Json::value_t::object},
        {"verifySsl", Json::value_t::boolean},
        {"fetchToolsOnConnect", Json::value_t::boolean},
    };
    for (const auto& [key, type] : typed_keys) {
        auto checked = expect_type(document, key, type);
        if (!checked) {
            return tl::unexpected(checked.error());
        }
    }

    ConnectionConfig config;
    config.server_id = document.value("serverId", config.server_id);
    config.url = document.value("url", std::string{});
    if (document.contains("token")) {
        config.bearer_token = document["token"].get<std::string>();
    }
    if (document.contains("headers")) {
        for (const auto& [name, value] : document["headers"].items()) {
            if (value.is_string() == false) {
                return tl::unexpected(ConfigError{"header '" + name + "' must be a string"});
            }
            config.with_header(name, value.get<std::string>());
        }
    }

    config.request_timeout = read_millis(document, "requestTimeoutMs").value_or(config.request_timeout);
    config.endpoint_timeout = read_millis(document, "endpointTimeoutMs").value_or(config.endpoint_timeout);
    config.connect_timeout = read_millis(document, "connectTimeoutMs").value_or(config.connect_timeout);
    config.verify_ssl = document.value("verifySsl", config.verify_ssl);
    config.fetch_tools_on_connect = document.value("fetchToolsOnConnect", config.fetch_tools_on_connect);

    if (document.contains("reconnect")) {
        const auto& node = document["reconnect"];
        const std::pair<const char*, Json::value_t> reconnect_keys[] = {
            {"minDelayMs", Json::value_t::number_integer},
            {"maxDelayMs", Json::value_t::number_integer},
            {"multiplier", Json::value_t::number_float},
            {"maxAttempts", Json::value_t::number_integer},
        };
        for (const auto& [key, type] : reconnect_keys) {
            auto checked = expect_type(node, key, type);
            if (!checked) {
                return tl::unexpected(checked.error());
            }
        }

        config.reconnect.min_delay = read_millis(node, "minDelayMs").value_or(config.reconnect.min_delay);
        config.reconnect.max_delay = read_millis(node, "maxDelayMs").value_or(config.reconnect.max_delay);
        config.reconnect.multiplier = node.value("multiplier", config.reconnect.multiplier);
        if (node.contains("maxAttempts")) {
            const auto attempts = node["maxAttempts"].get<std::int64_t>();
            if (attempts < 0) {
                return tl::unexpected(ConfigError{"reconnect.maxAttempts must be >= 0"});
            }
            config.reconnect.max_attempts = static_cast<std::size_t>(attempts);
        }
    }

    auto valid = config.validate();
    if (!valid) {
        return tl::unexpected(valid.error());
    }
    return config;
}

tl::expected<ConnectionConfig, ConfigError> load_connection_config_file(
    const std::filesystem::path& path
) {
    std::ifstream input(path);
    if (input.is_open() == false) {
        return tl::unexpected(ConfigError{"cannot open " + path.string()});
    }

    const auto document = Json::parse(input, nullptr, /*allow_exceptions=*/false, /*ignore_comments=*/true);
    if (document.is_discarded()) {
        return tl::unexpected(ConfigError{path.string() + " is not valid JSON"});
    }
    return load_connection_config(document);
}

}  // namespace mcplink
