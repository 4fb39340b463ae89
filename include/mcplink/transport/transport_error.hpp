#ifndef MCPLINK_TRANSPORT_TRANSPORT_ERROR_HPP
#define MCPLINK_TRANSPORT_TRANSPORT_ERROR_HPP

#include "mcplink/transport/http_client.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace mcplink {

// ─────────────────────────────────────────────────────────────────────────────
// Authentication failures
// ─────────────────────────────────────────────────────────────────────────────
// A 401 either means the credential could not even be parsed by the server
// (the caller must fix it) or that it was understood but refused (the caller
// must obtain a new one). Neither is retried.

enum class AuthFailure {
    Malformed,   // → invalid-token
    Rejected     // → needs-auth
};

[[nodiscard]] constexpr std::string_view to_string(AuthFailure failure) noexcept {
    switch (failure) {
        case AuthFailure::Malformed: return "malformed";
        case AuthFailure::Rejected:  return "rejected";
    }
    return "unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// Transport Error Types
// ─────────────────────────────────────────────────────────────────────────────

struct HttpTransportError {
    enum class Code {
        ConnectionFailed,    // Could not connect to server
        Timeout,             // Request timed out
        SslError,            // TLS/SSL handshake or verification failed
        HttpError,           // Server returned an unclassified error status
        Unauthorized,        // 401, see auth_failure
        Forbidden,           // 403
        RateLimited,         // 429, see retry_after
        ServerError,         // 500/502/503/504
        SessionExpired,      // Session id no longer valid (404)
        EndpointTimeout,     // HTTP+SSE server never announced its POST endpoint
        Closed,              // Transport was closed
        InvalidResponse,     // Server returned malformed response
        ParseError           // Failed to parse JSON response
    };

    Code code;
    std::string message;
    std::optional<int> http_status;                    // HTTP status code if applicable
    std::optional<AuthFailure> auth_failure;           // Unauthorized only
    std::optional<std::chrono::milliseconds> retry_after;  // RateLimited only

    [[nodiscard]] bool is_auth_failure() const noexcept {
        return code == Code::Unauthorized;
    }

    /// True when reconnecting later may succeed.
    [[nodiscard]] bool retryable() const noexcept {
        switch (code) {
            case Code::ConnectionFailed:
            case Code::Timeout:
            case Code::RateLimited:
            case Code::ServerError:
            case Code::SessionExpired:
            case Code::EndpointTimeout:
            case Code::Closed:
                return true;
            default:
                return false;
        }
    }

    static HttpTransportError connection_failed(const std::string& msg) {
        return {Code::ConnectionFailed, msg, std::nullopt, std::nullopt, std::nullopt};
    }

    static HttpTransportError timeout(const std::string& msg) {
        return {Code::Timeout, msg, std::nullopt, std::nullopt, std::nullopt};
    }

    static HttpTransportError ssl_error(const std::string& msg) {
        return {Code::SslError, msg, std::nullopt, std::nullopt, std::nullopt};
    }

    static HttpTransportError http_error(int status, const std::string& msg) {
        return {Code::HttpError, msg, status, std::nullopt, std::nullopt};
    }

    static HttpTransportError unauthorized(AuthFailure failure, const std::string& msg) {
        return {Code::Unauthorized, msg, 401, failure, std::nullopt};
    }

    static HttpTransportError forbidden() {
        return {Code::Forbidden, "Access forbidden", 403, std::nullopt, std::nullopt};
    }

    static HttpTransportError rate_limited(std::chrono::milliseconds retry_after) {
        return {Code::RateLimited, "Rate limited", 429, std::nullopt, retry_after};
    }

    static HttpTransportError server_error(int status, const std::string& msg) {
        return {Code::ServerError, msg, status, std::nullopt, std::nullopt};
    }

    static HttpTransportError session_expired() {
        return {Code::SessionExpired, "Session expired", 404, std::nullopt, std::nullopt};
    }

    static HttpTransportError endpoint_timeout(std::chrono::milliseconds waited) {
        return {Code::EndpointTimeout,
                "Timed out after " + std::to_string(waited.count()) + "ms waiting for endpoint event",
                std::nullopt, std::nullopt, std::nullopt};
    }

    static HttpTransportError closed() {
        return {Code::Closed, "Transport is closed", std::nullopt, std::nullopt, std::nullopt};
    }

    static HttpTransportError invalid_response(const std::string& msg) {
        return {Code::InvalidResponse, msg, std::nullopt, std::nullopt, std::nullopt};
    }

    static HttpTransportError parse_error(const std::string& msg) {
        return {Code::ParseError, msg, std::nullopt, std::nullopt, std::nullopt};
    }

    // Convert from HttpClientError
    static HttpTransportError from_client_error(const HttpClientError& err) {
        switch (err.code) {
            case HttpClientError::Code::ConnectionFailed:
                return connection_failed(err.message);
            case HttpClientError::Code::Timeout:
                return timeout(err.message);
            case HttpClientError::Code::SslError:
                return ssl_error(err.message);
            case HttpClientError::Code::Cancelled:
                return closed();
            case HttpClientError::Code::ResponseTooLarge:
                return invalid_response(err.message);
            default:
                return connection_failed(err.message);
        }
    }
};

template <typename T>
using HttpResult = tl::expected<T, HttpTransportError>;

// ─────────────────────────────────────────────────────────────────────────────
// Status classification
// ─────────────────────────────────────────────────────────────────────────────

inline constexpr std::chrono::seconds kDefaultRetryAfter{60};

// Larger Retry-After values are clamped to a day
inline constexpr std::chrono::seconds kMaxRetryAfter{86'400};

/// Decide whether a 401 body describes a malformed or a rejected credential.
/// Only {"error":"invalid_token","error_description":"...Invalid token format..."}
/// counts as malformed; any other body, JSON or not, is a rejection.
[[nodiscard]] AuthFailure classify_unauthorized(std::string_view body);

/// Classify a non-2xx response. `body` may be truncated or empty.
[[nodiscard]] HttpTransportError classify_http_failure(
    int status,
    const HeaderMap& headers,
    std::string_view body
);

}  // namespace mcplink

#endif  // MCPLINK_TRANSPORT_TRANSPORT_ERROR_HPP
