#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Client Error
// ═══════════════════════════════════════════════════════════════════════════
// What callers of McpConnection see. Transport failures are classified first
// (HttpTransportError) and folded into this type at the API boundary.

#include "mcplink/protocol/json_rpc.hpp"
#include "mcplink/transport/transport_error.hpp"

#include <tl/expected.hpp>

#include <optional>
#include <string>

namespace mcplink {

/// Error codes for connection operations
enum class ClientErrorCode {
    NotConnected,     ///< No negotiated transport, or connect() already in progress
    TransportError,   ///< Network, HTTP status or stream failure
    ProtocolError,    ///< Malformed reply or JSON-RPC error from the server
    Timeout,          ///< No reply within the request timeout
    Disconnected,     ///< Rejected because the connection was torn down
    Unauthorized      ///< Credential rejected or malformed
};

[[nodiscard]] constexpr std::string_view to_string(ClientErrorCode code) noexcept {
    switch (code) {
        case ClientErrorCode::NotConnected:   return "NotConnected";
        case ClientErrorCode::TransportError: return "TransportError";
        case ClientErrorCode::ProtocolError:  return "ProtocolError";
        case ClientErrorCode::Timeout:        return "Timeout";
        case ClientErrorCode::Disconnected:   return "Disconnected";
        case ClientErrorCode::Unauthorized:   return "Unauthorized";
    }
    return "Unknown";
}

struct ClientError {
    ClientErrorCode code;
    std::string message;
    std::optional<JsonRpcError> rpc_error;  ///< Original RPC error if from server

    // ─────────────────────────────────────────────────────────────────────────
    // Factory Methods
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] static ClientError not_connected(std::string msg = "Not connected") {
        return {ClientErrorCode::NotConnected, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError transport_error(std::string msg) {
        return {ClientErrorCode::TransportError, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError protocol_error(std::string msg) {
        return {ClientErrorCode::ProtocolError, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError timeout(std::string msg) {
        return {ClientErrorCode::Timeout, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError disconnected() {
        return {ClientErrorCode::Disconnected, "Connection closed", std::nullopt};
    }

    [[nodiscard]] static ClientError unauthorized(std::string msg) {
        return {ClientErrorCode::Unauthorized, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError from_rpc_error(const JsonRpcError& err) {
        return {ClientErrorCode::ProtocolError, err.message, err};
    }

    [[nodiscard]] static ClientError from_transport_error(const HttpTransportError& err) {
        switch (err.code) {
            case HttpTransportError::Code::Unauthorized:
                return unauthorized(err.message);
            case HttpTransportError::Code::Timeout:
            case HttpTransportError::Code::EndpointTimeout:
                return timeout(err.message);
            case HttpTransportError::Code::InvalidResponse:
            case HttpTransportError::Code::ParseError:
                return protocol_error(err.message);
            default:
                return transport_error(err.message);
        }
    }
};

template <typename T>
using ClientResult = tl::expected<T, ClientError>;

}  // namespace mcplink
