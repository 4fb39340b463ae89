#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace mcplink {

// ─────────────────────────────────────────────────────────────────────────────
// Transport Kind
// ─────────────────────────────────────────────────────────────────────────────

enum class TransportKind {
    Unknown,       ///< Not negotiated yet
    Streamable,    ///< Streamable HTTP: every message is POSTed to the base URL
    LegacySse      ///< HTTP+SSE: one GET stream in, POSTs to the announced endpoint
};

[[nodiscard]] constexpr std::string_view to_string(TransportKind kind) noexcept {
    switch (kind) {
        case TransportKind::Unknown:    return "unknown";
        case TransportKind::Streamable: return "streamable";
        case TransportKind::LegacySse:  return "legacy-sse";
    }
    return "unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// Negotiated Transport
// ─────────────────────────────────────────────────────────────────────────────

struct StreamableTransport {
    std::optional<std::string> session_id;
    std::string session_header{"Mcp-Session-Id"};   // Name the server used
};

struct LegacySseTransport {
    std::optional<std::string> endpoint;     // Absolute; set by the endpoint event
    std::optional<std::string> session_id;   // sessionId query parameter of the endpoint
};

using NegotiatedTransport = std::variant<std::monostate, StreamableTransport, LegacySseTransport>;

[[nodiscard]] TransportKind kind_of(const NegotiatedTransport& transport) noexcept;

/// Where outbound messages go. nullopt while the HTTP+SSE endpoint is unknown
/// or when nothing has been negotiated.
[[nodiscard]] std::optional<std::string> post_target(
    const NegotiatedTransport& transport,
    std::string_view base_url
);

/// Only the HTTP+SSE stream carries the session; losing it must trigger a
/// reconnect. Streamable response streams end after every reply.
[[nodiscard]] bool reconnects_on_stream_end(const NegotiatedTransport& transport) noexcept;

/// Header to attach to POSTs as {name, value}, if the transport has one.
/// HTTP+SSE servers identify the session by the endpoint URL instead.
[[nodiscard]] std::optional<std::pair<std::string, std::string>> session_header(
    const NegotiatedTransport& transport
);

[[nodiscard]] std::optional<std::string> session_id(const NegotiatedTransport& transport);

/// Server-issued session ids are echoed into headers and logs: accept only
/// [A-Za-z0-9._-], 1 to 256 characters.
[[nodiscard]] bool is_valid_session_id(std::string_view id) noexcept;

}  // namespace mcplink
