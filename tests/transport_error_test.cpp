#include <catch2/catch_test_macros.hpp>

#include "mcplink/client/client_error.hpp"
#include "mcplink/transport/transport_error.hpp"

using namespace mcplink;
using namespace std::chrono_literals;
using Code = HttpTransportError::Code;

// ─────────────────────────────────────────────────────────────────────────────
// 401
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("classify_unauthorized separates malformed from rejected tokens", "[errors][auth]") {
    REQUIRE(classify_unauthorized(
        R"({"error":"invalid_token","error_description":"Invalid token format: expected JWT"})")
        == AuthFailure::Malformed);

    REQUIRE(classify_unauthorized(
        R"({"error":"invalid_token","error_description":"Token expired"})")
        == AuthFailure::Rejected);
    REQUIRE(classify_unauthorized(
        R"({"error":"insufficient_scope","error_description":"Invalid token format"})")
        == AuthFailure::Rejected);
    REQUIRE(classify_unauthorized(R"({"error":"invalid_token"})") == AuthFailure::Rejected);
    REQUIRE(classify_unauthorized("Unauthorized") == AuthFailure::Rejected);
    REQUIRE(classify_unauthorized("") == AuthFailure::Rejected);
}

TEST_CASE("classify_http_failure maps 401 to an auth failure", "[errors][auth]") {
    auto malformed = classify_http_failure(401, {},
        R"({"error":"invalid_token","error_description":"Invalid token format"})");
    REQUIRE(malformed.code == Code::Unauthorized);
    REQUIRE(malformed.is_auth_failure());
    REQUIRE(malformed.auth_failure == AuthFailure::Malformed);
    REQUIRE(malformed.message == "Invalid token format");
    REQUIRE(malformed.retryable() == false);

    auto rejected = classify_http_failure(401, {}, "");
    REQUIRE(rejected.auth_failure == AuthFailure::Rejected);
    REQUIRE(rejected.message == "Authentication required");
}

// ─────────────────────────────────────────────────────────────────────────────
// Other statuses
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("classify_http_failure maps statuses to error kinds", "[errors]") {
    SECTION("403 is final") {
        auto error = classify_http_failure(403, {}, "nope");
        REQUIRE(error.code == Code::Forbidden);
        REQUIRE(error.message == "Access forbidden");
        REQUIRE(error.retryable() == false);
    }

    SECTION("429 honours Retry-After seconds") {
        HeaderMap headers{{"retry-after", "7"}};
        auto error = classify_http_failure(429, headers, "");
        REQUIRE(error.code == Code::RateLimited);
        REQUIRE(error.message == "Rate limited");
        REQUIRE(error.retry_after == std::optional<std::chrono::milliseconds>{7000ms});
        REQUIRE(error.retryable());
    }

    SECTION("429 without a usable Retry-After waits a minute") {
        REQUIRE(classify_http_failure(429, {}, "").retry_after == std::optional<std::chrono::milliseconds>{60'000ms});

        HeaderMap dated{{"Retry-After", "Wed, 21 Oct 2026 07:28:00 GMT"}};
        REQUIRE(classify_http_failure(429, dated, "").retry_after == std::optional<std::chrono::milliseconds>{60'000ms});
    }

    SECTION("429 clamps an oversized Retry-After to a day") {
        HeaderMap huge{{"Retry-After", "9999999999"}};
        REQUIRE(classify_http_failure(429, huge, "").retry_after == std::optional<std::chrono::milliseconds>{kMaxRetryAfter});

        HeaderMap overflow{{"Retry-After", "99999999999999999999999"}};
        REQUIRE(classify_http_failure(429, overflow, "").retry_after == std::optional<std::chrono::milliseconds>{kMaxRetryAfter});
    }

    SECTION("gateway and server errors are retryable") {
        for (int status : {500, 502, 503, 504}) {
            auto error = classify_http_failure(status, {}, "upstream down");
            REQUIRE(error.code == Code::ServerError);
            REQUIRE(error.http_status == status);
            REQUIRE(error.message == "HTTP " + std::to_string(status) + ": upstream down");
            REQUIRE(error.retryable());
        }
    }

    SECTION("anything else is a plain HTTP error with a truncated body") {
        auto error = classify_http_failure(418, {}, std::string(1000, 'x'));
        REQUIRE(error.code == Code::HttpError);
        REQUIRE(error.http_status == 418);
        REQUIRE(error.message == "HTTP 418: " + std::string(200, 'x'));
        REQUIRE(error.retryable() == false);

        REQUIRE(classify_http_failure(400, {}, "").message == "HTTP 400");
    }
}

TEST_CASE("HttpTransportError factories carry their fixed messages", "[errors]") {
    REQUIRE(HttpTransportError::session_expired().message == "Session expired");
    REQUIRE(HttpTransportError::session_expired().http_status == 404);
    REQUIRE(HttpTransportError::session_expired().retryable());

    auto endpoint = HttpTransportError::endpoint_timeout(10'000ms);
    REQUIRE(endpoint.message == "Timed out after 10000ms waiting for endpoint event");
    REQUIRE(endpoint.retryable());

    REQUIRE(HttpTransportError::ssl_error("bad cert").retryable() == false);
    REQUIRE(HttpTransportError::invalid_response("x").retryable() == false);
}

TEST_CASE("HttpTransportError::from_client_error maps client failures", "[errors]") {
    REQUIRE(HttpTransportError::from_client_error(HttpClientError::connection_failed("refused")).code == Code::ConnectionFailed);
    REQUIRE(HttpTransportError::from_client_error(HttpClientError::timeout("slow")).code == Code::Timeout);
    REQUIRE(HttpTransportError::from_client_error(HttpClientError::ssl_error("cert")).code == Code::SslError);
    REQUIRE(HttpTransportError::from_client_error(HttpClientError::cancelled()).code == Code::Closed);
    REQUIRE(HttpTransportError::from_client_error(HttpClientError::unknown("?")).code == Code::ConnectionFailed);

    auto too_large = HttpTransportError::from_client_error(HttpClientError::response_too_large(1024));
    REQUIRE(too_large.code == Code::InvalidResponse);
    REQUIRE(too_large.message == "Response body exceeds 1024 bytes");
}

// ─────────────────────────────────────────────────────────────────────────────
// Client-facing errors
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("ClientError::from_transport_error picks the caller-facing kind", "[errors][client]") {
    REQUIRE(ClientError::from_transport_error(classify_http_failure(401, {}, "")).code == ClientErrorCode::Unauthorized);
    REQUIRE(ClientError::from_transport_error(HttpTransportError::timeout("t")).code == ClientErrorCode::Timeout);
    REQUIRE(ClientError::from_transport_error(HttpTransportError::endpoint_timeout(1ms)).code == ClientErrorCode::Timeout);
    REQUIRE(ClientError::from_transport_error(HttpTransportError::invalid_response("r")).code == ClientErrorCode::ProtocolError);
    REQUIRE(ClientError::from_transport_error(HttpTransportError::forbidden()).code == ClientErrorCode::TransportError);

    auto error = ClientError::from_transport_error(HttpTransportError::server_error(503, "HTTP 503"));
    REQUIRE(error.message == "HTTP 503");
}

TEST_CASE("ClientError keeps the server's JSON-RPC error", "[errors][client]") {
    auto error = ClientError::from_rpc_error(JsonRpcError{-32602, "Invalid params", std::nullopt});

    REQUIRE(error.code == ClientErrorCode::ProtocolError);
    REQUIRE(error.message == "Invalid params");
    REQUIRE(error.rpc_error.has_value());
    REQUIRE(error.rpc_error->code == -32602);
    REQUIRE(ClientError::disconnected().message == "Connection closed");
}
