#ifndef MCPLINK_CLIENT_CONNECTION_CONFIG_HPP
#define MCPLINK_CLIENT_CONNECTION_CONFIG_HPP

#include "mcplink/protocol/mcp_types.hpp"
#include "mcplink/transport/http_types.hpp"
#include "mcplink/transport/sse_parser.hpp"

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mcplink {

struct IBackoffPolicy;

inline constexpr const char* kClientName = "mcplink";
inline constexpr const char* kClientVersion = "0.3.0";

// ─────────────────────────────────────────────────────────────────────────────
// Reconnection
// ─────────────────────────────────────────────────────────────────────────────
// delay(attempt) = min(max_delay, min_delay * multiplier^attempt)

struct ReconnectConfig {
    std::chrono::milliseconds min_delay{500};
    double multiplier{2.0};
    std::chrono::milliseconds max_delay{30'000};

    // Consecutive failed attempts before giving up. 0 = never give up.
    std::size_t max_attempts{5};
};

struct ConfigError {
    std::string message;
};

// ─────────────────────────────────────────────────────────────────────────────
// Connection Configuration
// ─────────────────────────────────────────────────────────────────────────────
// Everything needed to reach one MCP server.

struct ConnectionConfig {
    // ─────────────────────────────────────────────────────────────────────────
    // Server
    // ─────────────────────────────────────────────────────────────────────────

    // Used in log lines and timeout messages.
    std::string server_id{"default"};

    // Base URL, e.g. "https://mcp.example.com/mcp". Must be http(s).
    std::string url;

    // ─────────────────────────────────────────────────────────────────────────
    // Authentication
    // ─────────────────────────────────────────────────────────────────────────

    // Sent as "Authorization: Bearer <token>". Never refreshed by the client.
    std::optional<std::string> bearer_token;

    // Extra headers sent with every request.
    HeaderMap headers;

    // ─────────────────────────────────────────────────────────────────────────
    // Timeouts
    // ─────────────────────────────────────────────────────────────────────────

    // Per request, from send to reply.
    std::chrono::milliseconds request_timeout{30'000};

    // How long an HTTP+SSE stream may take to announce its POST endpoint.
    std::chrono::milliseconds endpoint_timeout{10'000};

    // TCP + TLS establishment.
    std::chrono::milliseconds connect_timeout{10'000};

    // ─────────────────────────────────────────────────────────────────────────
    // Reconnection
    // ─────────────────────────────────────────────────────────────────────────

    ReconnectConfig reconnect;

    // Overrides the exponential policy built from `reconnect` when set.
    std::shared_ptr<IBackoffPolicy> backoff_policy;

    // ─────────────────────────────────────────────────────────────────────────
    // MCP
    // ─────────────────────────────────────────────────────────────────────────

    Implementation client_info{kClientName, kClientVersion};
    std::string protocol_version{kProtocolVersion};
    std::string legacy_protocol_version{kLegacyProtocolVersion};

    // Response headers that may carry the session id, tried in order.
    std::vector<std::string> session_header_names{"Mcp-Session-Id", "Session-Id"};

    // Issue tools/list right after the handshake and publish it on the status.
    bool fetch_tools_on_connect{true};

    bool verify_ssl{true};

    SseParserConfig parser;

    // ─────────────────────────────────────────────────────────────────────────
    // Builder-Style Helpers
    // ─────────────────────────────────────────────────────────────────────────

    ConnectionConfig& with_bearer_token(std::string token);
    ConnectionConfig& with_header(const std::string& name, std::string value);
    ConnectionConfig& with_request_timeout(std::chrono::milliseconds timeout);
    ConnectionConfig& with_reconnect(ReconnectConfig settings);

    /// Check the URL and the numeric settings.
    [[nodiscard]] tl::expected<void, ConfigError> validate() const;
};

// ─────────────────────────────────────────────────────────────────────────────
// Loading
// ─────────────────────────────────────────────────────────────────────────────
// {
//   "serverId": "github",
//   "url": "https://mcp.example.com/mcp",
//   "token": "...",
//   "headers": {"X-Tenant": "acme"},
//   "requestTimeoutMs": 30000,
//   "endpointTimeoutMs": 10000,
//   "connectTimeoutMs": 10000,
//   "reconnect": {"minDelayMs": 500, "maxDelayMs": 30000, "multiplier": 2, "maxAttempts": 5},
//   "verifySsl": true,
//   "fetchToolsOnConnect": true
// }
// Missing keys keep their defaults. The result is validated.

[[nodiscard]] tl::expected<ConnectionConfig, ConfigError> load_connection_config(
    const nlohmann::json& document
);

[[nodiscard]] tl::expected<ConnectionConfig, ConfigError> load_connection_config_file(
    const std::filesystem::path& path
);

}  // namespace mcplink

#endif  // MCPLINK_CLIENT_CONNECTION_CONFIG_HPP
