#ifndef MCPLINK_TESTS_MOCKS_MOCK_HTTP_CLIENT_HPP
#define MCPLINK_TESTS_MOCKS_MOCK_HTTP_CLIENT_HPP

#include "mcplink/protocol/json_rpc.hpp"
#include "mcplink/transport/http_client.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/experimental/channel.hpp>
#include <asio/redirect_error.hpp>
#include <asio/use_awaitable.hpp>

#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcplink::testing {

// ─────────────────────────────────────────────────────────────────────────────
// MockHttpClient - Test double for IHttpClient
// ─────────────────────────────────────────────────────────────────────────────
// Allows tests to:
// - Answer requests from a handler (status, headers, body)
// - Hold a response body open and push SSE chunks into it later
// - Inspect request history
//
// Everything runs on the test's io_context thread.

struct RecordedRequest {
    HttpMethod method;
    std::string url;
    HeaderMap headers;
    std::string body;

    [[nodiscard]] Json json() const {
        return Json::parse(body, nullptr, false);
    }

    [[nodiscard]] std::string rpc_method() const {
        const auto parsed = json();
        if (parsed.is_object() == false) {
            return {};
        }
        return parsed.value("method", "");
    }

    [[nodiscard]] std::optional<std::string> header(std::string_view name) const {
        return get_header(headers, name);
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// StreamFeed - body of one response, fed by the test
// ─────────────────────────────────────────────────────────────────────────────

class StreamFeed {
public:
    explicit StreamFeed(asio::any_io_executor executor)
        : signal_(std::move(executor), 1)
    {}

    void push(std::string chunk) {
        chunks_.push_back(std::move(chunk));
        wake();
    }

    /// End the body normally once buffered chunks are read.
    void close() {
        closed_ = true;
        wake();
    }

    void fail(HttpClientError error) {
        error_ = std::move(error);
        wake();
    }

    void cancel() {
        cancelled_ = true;
        wake();
    }

    [[nodiscard]] bool cancelled() const noexcept { return cancelled_; }

    asio::awaitable<HttpClientResult<std::optional<std::string>>> next() {
        while (true) {
            if (cancelled_) {
                co_return tl::unexpected(HttpClientError::cancelled());
            }
            if (chunks_.empty() == false) {
                std::string chunk = std::move(chunks_.front());
                chunks_.pop_front();
                co_return std::optional<std::string>(std::move(chunk));
            }
            if (error_.has_value()) {
                co_return tl::unexpected(*error_);
            }
            if (closed_) {
                co_return std::optional<std::string>{};
            }

            asio::error_code ec;
            co_await signal_.async_receive(asio::redirect_error(asio::use_awaitable, ec));
        }
    }

private:
    void wake() {
        // A full signal already guarantees the reader looks again
        (void)signal_.try_send(asio::error_code{});
    }

    asio::experimental::channel<void(asio::error_code)> signal_;
    std::deque<std::string> chunks_;
    std::optional<HttpClientError> error_;
    bool closed_{false};
    bool cancelled_{false};
};

// ─────────────────────────────────────────────────────────────────────────────
// MockReply - what the handler answers with
// ─────────────────────────────────────────────────────────────────────────────

struct MockReply {
    int status{200};
    HeaderMap headers;
    std::string body;
    std::shared_ptr<StreamFeed> feed;              // Held-open body; `body` is ignored
    std::optional<HttpClientError> error;          // async_open fails

    static MockReply json(const Json& document, int status = 200, HeaderMap extra = {}) {
        MockReply reply;
        reply.status = status;
        reply.headers = std::move(extra);
        set_header(reply.headers, "Content-Type", "application/json");
        reply.body = document.dump();
        return reply;
    }

    static MockReply sse(std::string body, HeaderMap extra = {}) {
        MockReply reply;
        reply.headers = std::move(extra);
        set_header(reply.headers, "Content-Type", "text/event-stream");
        reply.body = std::move(body);
        return reply;
    }

    static MockReply status_only(int status, std::string body = {}, HeaderMap extra = {}) {
        MockReply reply;
        reply.status = status;
        reply.headers = std::move(extra);
        reply.body = std::move(body);
        return reply;
    }

    static MockReply held_open(std::shared_ptr<StreamFeed> feed, HeaderMap extra = {}) {
        MockReply reply;
        reply.headers = std::move(extra);
        set_header(reply.headers, "Content-Type", "text/event-stream");
        reply.feed = std::move(feed);
        return reply;
    }

    static MockReply failure(HttpClientError error) {
        MockReply reply;
        reply.error = std::move(error);
        return reply;
    }
};

/// One SSE event in wire format.
inline std::string sse_event(const std::string& event, const std::string& data) {
    return "event: " + event + "\ndata: " + data + "\n\n";
}

inline std::string sse_message(const Json& message) {
    return sse_event("message", message.dump());
}

// ─────────────────────────────────────────────────────────────────────────────
// MockHttpStream
// ─────────────────────────────────────────────────────────────────────────────

class MockHttpStream final : public HttpStream {
public:
    MockHttpStream(HttpResponseHead head, std::shared_ptr<StreamFeed> feed)
        : head_(std::move(head))
        , feed_(std::move(feed))
    {}

    ~MockHttpStream() override {
        feed_->cancel();
    }

    [[nodiscard]] const HttpResponseHead& head() const noexcept override {
        return head_;
    }

    asio::awaitable<HttpClientResult<std::optional<std::string>>> async_read_some() override {
        co_return co_await feed_->next();
    }

    void cancel() override {
        feed_->cancel();
    }

private:
    HttpResponseHead head_;
    std::shared_ptr<StreamFeed> feed_;
};

// ─────────────────────────────────────────────────────────────────────────────
// MockHttpClient
// ─────────────────────────────────────────────────────────────────────────────

class MockHttpClient final : public IHttpClient {
public:
    using Handler = std::function<MockReply(const RecordedRequest& request)>;

    explicit MockHttpClient(asio::any_io_executor executor)
        : executor_(std::move(executor))
    {}

    void set_handler(Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = std::move(handler);
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Test Verification
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] std::vector<RecordedRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    [[nodiscard]] std::size_t request_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

    [[nodiscard]] std::vector<RecordedRequest> requests_with(HttpMethod method) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<RecordedRequest> matching;
        for (const auto& request : requests_) {
            if (request.method == method) {
                matching.push_back(request);
            }
        }
        return matching;
    }

    /// Requests whose JSON-RPC method matches.
    [[nodiscard]] std::vector<RecordedRequest> rpc_requests(const std::string& method) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<RecordedRequest> matching;
        for (const auto& request : requests_) {
            if (request.rpc_method() == method) {
                matching.push_back(request);
            }
        }
        return matching;
    }

    [[nodiscard]] std::chrono::milliseconds connect_timeout() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return connect_timeout_;
    }

    [[nodiscard]] bool verify_ssl() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return verify_ssl_;
    }

    [[nodiscard]] std::size_t cancel_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancel_count_;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // IHttpClient Implementation
    // ─────────────────────────────────────────────────────────────────────────

    void set_connect_timeout(std::chrono::milliseconds timeout) override {
        std::lock_guard<std::mutex> lock(mutex_);
        connect_timeout_ = timeout;
    }

    void set_verify_ssl(bool verify) override {
        std::lock_guard<std::mutex> lock(mutex_);
        verify_ssl_ = verify;
    }

    asio::awaitable<HttpClientResult<std::unique_ptr<HttpStream>>> async_open(HttpRequest request) override {
        RecordedRequest recorded{
            request.method,
            request.url,
            request.headers,
            request.body.value_or(std::string{})
        };

        Handler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(recorded);
            if (cancelled_) {
                co_return tl::unexpected(HttpClientError::cancelled());
            }
            handler = handler_;
        }

        if (!handler) {
            co_return tl::unexpected(HttpClientError::connection_failed("No handler installed"));
        }

        MockReply reply = handler(recorded);
        if (reply.error.has_value()) {
            co_return tl::unexpected(*reply.error);
        }

        auto feed = reply.feed;
        if (!feed) {
            feed = std::make_shared<StreamFeed>(executor_);
            if (reply.body.empty() == false) {
                feed->push(std::move(reply.body));
            }
            feed->close();
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_feeds_.push_back(feed);
        }

        HttpResponseHead head{reply.status, std::move(reply.headers)};
        co_return std::unique_ptr<HttpStream>(std::make_unique<MockHttpStream>(std::move(head), std::move(feed)));
    }

    void cancel() override {
        std::vector<std::weak_ptr<StreamFeed>> feeds;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
            ++cancel_count_;
            feeds.swap(open_feeds_);
        }
        for (auto& weak : feeds) {
            if (auto feed = weak.lock()) {
                feed->cancel();
            }
        }
    }

    void reset() override {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = false;
    }

private:
    asio::any_io_executor executor_;

    mutable std::mutex mutex_;
    Handler handler_;
    std::vector<RecordedRequest> requests_;
    std::vector<std::weak_ptr<StreamFeed>> open_feeds_;
    std::chrono::milliseconds connect_timeout_{0};
    bool verify_ssl_{true};
    bool cancelled_{false};
    std::size_t cancel_count_{0};
};

}  // namespace mcplink::testing

#endif  // MCPLINK_TESTS_MOCKS_MOCK_HTTP_CLIENT_HPP
