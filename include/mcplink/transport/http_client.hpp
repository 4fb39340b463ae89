#pragma once

#include "mcplink/transport/http_types.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <tl/expected.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace mcplink {

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Client Error
// ─────────────────────────────────────────────────────────────────────────────

struct HttpClientError {
    enum class Code {
        ConnectionFailed,
        Timeout,
        SslError,
        Cancelled,
        ResponseTooLarge,
        Unknown
    };

    Code code;
    std::string message;

    static HttpClientError connection_failed(const std::string& msg) {
        return {Code::ConnectionFailed, msg};
    }
    static HttpClientError timeout(const std::string& msg) {
        return {Code::Timeout, msg};
    }
    static HttpClientError ssl_error(const std::string& msg) {
        return {Code::SslError, msg};
    }
    static HttpClientError cancelled() {
        return {Code::Cancelled, "Request cancelled"};
    }
    static HttpClientError response_too_large(std::size_t limit) {
        return {Code::ResponseTooLarge, "Response body exceeds " + std::to_string(limit) + " bytes"};
    }
    static HttpClientError unknown(const std::string& msg) {
        return {Code::Unknown, msg};
    }
};

template <typename T>
using HttpClientResult = tl::expected<T, HttpClientError>;

// ─────────────────────────────────────────────────────────────────────────────
// Response Head
// ─────────────────────────────────────────────────────────────────────────────

struct HttpResponseHead {
    int status_code{0};
    HeaderMap headers;

    [[nodiscard]] bool is_success() const {
        return (status_code >= 200) && (status_code < 300);
    }

    [[nodiscard]] bool is_sse() const {
        return content_type_contains("text/event-stream");
    }

    [[nodiscard]] bool is_json() const {
        return content_type_contains("application/json");
    }

    [[nodiscard]] std::optional<std::string> header(std::string_view name) const {
        return get_header(headers, name);
    }

private:
    [[nodiscard]] bool content_type_contains(std::string_view media_type) const {
        const auto content_type = get_header(headers, "Content-Type");
        const bool found = content_type.has_value();
        if (found == false) {
            return false;
        }
        return content_type->find(media_type) != std::string::npos;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// HttpStream
// ─────────────────────────────────────────────────────────────────────────────
// An open response whose head has arrived and whose body is read
// incrementally. Long-lived event streams and one-shot document bodies are
// read the same way. Destroying the stream cancels the transfer.

class HttpStream {
public:
    virtual ~HttpStream() = default;

    [[nodiscard]] virtual const HttpResponseHead& head() const noexcept = 0;

    /// Next body chunk, in arrival order. nullopt means the body ended normally.
    [[nodiscard]] virtual asio::awaitable<HttpClientResult<std::optional<std::string>>> async_read_some() = 0;

    /// Abort the transfer. A pending or later read completes with Cancelled.
    virtual void cancel() = 0;

    /// Read the remaining body. A body longer than `limit` cancels the
    /// transfer and fails with ResponseTooLarge.
    [[nodiscard]] asio::awaitable<HttpClientResult<std::string>> async_read_all(
        std::size_t limit = kMaxBodySize
    );

    /// At most the first `limit` bytes of the body; the rest is discarded.
    /// For diagnostics such as error bodies.
    [[nodiscard]] asio::awaitable<HttpClientResult<std::string>> async_read_prefix(std::size_t limit);

    static constexpr std::size_t kMaxBodySize = 4 * 1024 * 1024;

    [[nodiscard]] int status_code() const noexcept { return head().status_code; }
};

// ─────────────────────────────────────────────────────────────────────────────
// IHttpClient
// ─────────────────────────────────────────────────────────────────────────────
// Opens streaming HTTP exchanges. Implementations must complete awaits on the
// awaiting coroutine's executor.

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual void set_connect_timeout(std::chrono::milliseconds timeout) = 0;

    virtual void set_verify_ssl(bool verify) = 0;

    /// Send the request and complete once the response head has arrived.
    [[nodiscard]] virtual asio::awaitable<HttpClientResult<std::unique_ptr<HttpStream>>> async_open(
        HttpRequest request
    ) = 0;

    /// Cancel every open exchange.
    virtual void cancel() = 0;

    /// Allow new exchanges after cancel().
    virtual void reset() = 0;
};

/// The default implementation (cpr/libcurl). Chunks are delivered on `executor`.
std::unique_ptr<IHttpClient> make_http_client(asio::any_io_executor executor);

}  // namespace mcplink
