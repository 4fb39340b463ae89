#include <catch2/catch_test_macros.hpp>

#include "mcplink/client/connection_config.hpp"

#include <filesystem>
#include <fstream>

using namespace mcplink;
using namespace std::chrono_literals;

// ═══════════════════════════════════════════════════════════════════════════
// Defaults and validation
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ConnectionConfig defaults", "[config]") {
    ConnectionConfig config;

    REQUIRE(config.server_id == "default");
    REQUIRE(config.request_timeout == 30'000ms);
    REQUIRE(config.endpoint_timeout == 10'000ms);
    REQUIRE(config.reconnect.min_delay == 500ms);
    REQUIRE(config.reconnect.max_delay == 30'000ms);
    REQUIRE(config.reconnect.multiplier == 2.0);
    REQUIRE(config.reconnect.max_attempts == 5);
    REQUIRE(config.protocol_version == "2025-06-18");
    REQUIRE(config.legacy_protocol_version == "2024-11-05");
    REQUIRE(config.session_header_names == std::vector<std::string>{"Mcp-Session-Id", "Session-Id"});
    REQUIRE(config.client_info.name == kClientName);
    REQUIRE(config.fetch_tools_on_connect);
    REQUIRE(config.verify_ssl);
}

TEST_CASE("ConnectionConfig builders", "[config]") {
    ConnectionConfig config;
    config.url = "https://mcp.example.com/mcp";
    config.with_bearer_token("secret")
          .with_header("X-Tenant", "acme")
          .with_header("x-tenant", "globex")
          .with_request_timeout(5s)
          .with_reconnect(ReconnectConfig{100ms, 3.0, 1s, 0});

    REQUIRE(config.bearer_token == std::optional<std::string>{"secret"});
    REQUIRE(config.headers.size() == 1);
    REQUIRE(get_header(config.headers, "X-Tenant") == std::optional<std::string>{"globex"});
    REQUIRE(config.request_timeout == 5000ms);
    REQUIRE(config.reconnect.max_attempts == 0);
    REQUIRE(config.validate().has_value());
}

TEST_CASE("ConnectionConfig::validate rejects unusable settings", "[config]") {
    ConnectionConfig config;
    config.url = "http://localhost:8080/sse";
    REQUIRE(config.validate().has_value());

    SECTION("missing url") {
        config.url.clear();
        REQUIRE(config.validate().error().message == "url is required");
    }
    SECTION("non-http url") {
        config.url = "ws://localhost:8080";
        REQUIRE_FALSE(config.validate().has_value());
    }
    SECTION("zero timeout") {
        config.request_timeout = 0ms;
        REQUIRE_FALSE(config.validate().has_value());
    }
    SECTION("shrinking backoff") {
        config.reconnect.multiplier = 0.5;
        REQUIRE_FALSE(config.validate().has_value());
    }
    SECTION("inverted delay bounds") {
        config.reconnect.min_delay = 10s;
        config.reconnect.max_delay = 1s;
        REQUIRE_FALSE(config.validate().has_value());
    }
    SECTION("no session header names") {
        config.session_header_names.clear();
        REQUIRE_FALSE(config.validate().has_value());
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Loading
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("load_connection_config reads every key", "[config][load]") {
    Json document = {
        {"serverId", "github"},
        {"url", "https://mcp.example.com/mcp"},
        {"token", "abc"},
        {"headers", {{"X-Tenant", "acme"}}},
        {"requestTimeoutMs", 1500},
        {"endpointTimeoutMs", 2500},
        {"connectTimeoutMs", 3500},
        {"reconnect", {{"minDelayMs", 100}, {"maxDelayMs", 800}, {"multiplier", 1.5}, {"maxAttempts", 0}}},
        {"verifySsl", false},
        {"fetchToolsOnConnect", false}
    };

    auto loaded = load_connection_config(document);

    REQUIRE(loaded.has_value());
    REQUIRE(loaded->server_id == "github");
    REQUIRE(loaded->url == "https://mcp.example.com/mcp");
    REQUIRE(loaded->bearer_token == std::optional<std::string>{"abc"});
    REQUIRE(get_header(loaded->headers, "x-tenant") == std::optional<std::string>{"acme"});
    REQUIRE(loaded->request_timeout == 1500ms);
    REQUIRE(loaded->endpoint_timeout == 2500ms);
    REQUIRE(loaded->connect_timeout == 3500ms);
    REQUIRE(loaded->reconnect.min_delay == 100ms);
    REQUIRE(loaded->reconnect.max_delay == 800ms);
    REQUIRE(loaded->reconnect.multiplier == 1.5);
    REQUIRE(loaded->reconnect.max_attempts == 0);
    REQUIRE(loaded->verify_ssl == false);
    REQUIRE(loaded->fetch_tools_on_connect == false);
}

TEST_CASE("load_connection_config keeps defaults for missing keys", "[config][load]") {
    auto loaded = load_connection_config({{"url", "http://localhost:3000/mcp"}, {"reconnect", {{"multiplier", 3}}}});

    REQUIRE(loaded.has_value());
    REQUIRE(loaded->server_id == "default");
    REQUIRE(loaded->bearer_token.has_value() == false);
    REQUIRE(loaded->request_timeout == 30'000ms);
    REQUIRE(loaded->reconnect.multiplier == 3.0);
    REQUIRE(loaded->reconnect.max_attempts == 5);
}

TEST_CASE("load_connection_config reports bad documents", "[config][load]") {
    REQUIRE_FALSE(load_connection_config(Json::array()).has_value());
    REQUIRE_FALSE(load_connection_config(Json::object()).has_value());

    auto wrong_type = load_connection_config({{"url", "http://localhost"}, {"requestTimeoutMs", "30s"}});
    REQUIRE_FALSE(wrong_type.has_value());
    REQUIRE(wrong_type.error().message == "wrong type for 'requestTimeoutMs'");

    auto bad_header = load_connection_config({{"url", "http://localhost"}, {"headers", {{"X-Count", 3}}}});
    REQUIRE_FALSE(bad_header.has_value());

    auto negative = load_connection_config({{"url", "http://localhost"}, {"reconnect", {{"maxAttempts", -1}}}});
    REQUIRE_FALSE(negative.has_value());

    auto invalid = load_connection_config({{"url", "http://localhost"}, {"reconnect", {{"minDelayMs", 5000}, {"maxDelayMs", 10}}}});
    REQUIRE_FALSE(invalid.has_value());
}

TEST_CASE("load_connection_config_file reads JSON with comments", "[config][load]") {
    const auto path = std::filesystem::temp_directory_path() / "mcplink_connection_config_test.json";
    {
        std::ofstream out(path);
        out << "{\n"
               "  // local development server\n"
               "  \"serverId\": \"local\",\n"
               "  \"url\": \"http://localhost:8080/sse\"\n"
               "}\n";
    }

    auto loaded = load_connection_config_file(path);
    std::filesystem::remove(path);

    REQUIRE(loaded.has_value());
    REQUIRE(loaded->server_id == "local");

    REQUIRE_FALSE(load_connection_config_file(path).has_value());
}
