#include "mcplink/transport/http_client.hpp"

#include "mcplink/log/logger.hpp"

#include <asio/experimental/concurrent_channel.hpp>
#include <asio/redirect_error.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/use_future.hpp>
#include <cpr/cpr.h>

#include <atomic>
#include <charconv>
#include <future>
#include <mutex>
#include <system_error>
#include <vector>

namespace mcplink {

// ─────────────────────────────────────────────────────────────────────────────
// CprHttpClient
// ─────────────────────────────────────────────────────────────────────────────
// libcurl (through cpr) performs each exchange as one blocking transfer. Every
// transfer runs on its own std::async worker; its callbacks turn the response
// head and body chunks into TransferEvents and hand them to the awaiting
// coroutine over a thread-safe channel. A full channel blocks the worker, so
// a slow reader throttles the transfer instead of losing data. Returning false
// from a callback makes libcurl abort, which is how cancellation reaches the
// worker.

namespace {

constexpr std::size_t kChannelCapacity = 256;
constexpr std::chrono::milliseconds kCancelCheckInterval{50};

struct TransferEvent {
    enum class Kind { Head, Chunk, Finished };

    Kind kind{Kind::Finished};
    HttpResponseHead head;
    std::string data;
    std::optional<HttpClientError> error;
};

using EventChannel = asio::experimental::concurrent_channel<void(asio::error_code, TransferEvent)>;

struct Transfer {
    Transfer(asio::any_io_executor executor, std::size_t capacity)
        : events(std::move(executor), capacity)
    {}

    EventChannel events;
    std::atomic<bool> cancelled{false};

    // Worker thread only
    HttpResponseHead pending_head;
    bool head_sent{false};

    // Blocks until the reader makes room. False once the transfer is cancelled.
    bool deliver(TransferEvent event) {
        if (cancelled.load(std::memory_order_acquire)) {
            return false;
        }
        if (events.try_send(asio::error_code{}, event)) {
            return true;
        }

        auto sent = events.async_send(asio::error_code{}, std::move(event), asio::use_future);
        while (sent.wait_for(kCancelCheckInterval) != std::future_status::ready) {
            // The completion may never run once the io_context has stopped
            if (cancelled.load(std::memory_order_acquire)) {
                return false;
            }
        }
        try {
            sent.get();
        } catch (const std::system_error&) {
            return false;  // channel closed
        }
        return true;
    }

    bool send_head() {
        head_sent = true;
        TransferEvent event;
        event.kind = TransferEvent::Kind::Head;
        event.head = pending_head;
        return deliver(std::move(event));
    }

    bool on_header_line(std::string_view line) {
        while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
            line.remove_suffix(1);
        }

        const bool is_status_line = line.starts_with("HTTP/");
        if (is_status_line) {
            // A new block starts after every redirect or interim response
            pending_head = HttpResponseHead{};
            const auto space = line.find(' ');
            if (space != std::string_view::npos) {
                const auto code = line.substr(space + 1, 3);
                int status = 0;
                const auto [ptr, ec] = std::from_chars(code.data(), code.data() + code.size(), status);
                if (ec == std::errc{}) {
                    pending_head.status_code = status;
                }
            }
            return true;
        }

        if (line.empty()) {
            const int status = pending_head.status_code;
            const bool is_interim = (status < 200);
            const bool is_followed_redirect =
                (status >= 300) && (status < 400) && get_header(pending_head.headers, "Location").has_value();
            if (is_interim || is_followed_redirect || head_sent) {
                return true;
            }
            return send_head();
        }

        const auto colon = line.find(':');
        if (colon != std::string_view::npos) {
            std::string_view value = line.substr(colon + 1);
            while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
                value.remove_prefix(1);
            }
            set_header(pending_head.headers, line.substr(0, colon), std::string(value));
        }
        return true;
    }

    bool on_body(std::string_view data) {
        if (head_sent == false) {
            const bool sent = send_head();
            if (sent == false) {
                return false;
            }
        }
        TransferEvent event;
        event.kind = TransferEvent::Kind::Chunk;
        event.data = std::string(data);
        return deliver(std::move(event));
    }
};

HttpClientError map_error(const cpr::Error& error) {
    const std::string& msg = error.message;
    const bool is_ssl_error =
        (msg.find("SSL") != std::string::npos) ||
        (msg.find("ssl") != std::string::npos) ||
        (msg.find("certificate") != std::string::npos) ||
        (msg.find("TLS") != std::string::npos);
    if (is_ssl_error) {
        return HttpClientError::ssl_error(msg);
    }

    switch (error.code) {
        case cpr::ErrorCode::OPERATION_TIMEDOUT:
            return HttpClientError::timeout(msg);
        case cpr::ErrorCode::SSL_CONNECT_ERROR:
            return HttpClientError::ssl_error(msg);
        default:
            return HttpClientError::connection_failed(msg);
    }
}

void run_transfer(
    const std::shared_ptr<Transfer>& transfer,
    const HttpRequest& request,
    std::chrono::milliseconds connect_timeout,
    bool verify_ssl
) {
    cpr::Session session;
    session.SetUrl(cpr::Url{request.url});

    cpr::Header headers;
    for (const auto& [name, value] : request.headers) {
        headers[name] = value;
    }
    session.SetHeader(headers);
    session.SetConnectTimeout(cpr::ConnectTimeout{connect_timeout});
    session.SetVerifySsl(cpr::VerifySsl{verify_ssl});

    // Callback parameter types differ between cpr releases (std::string vs
    // std::string_view); generic lambdas accept either.
    session.SetHeaderCallback(cpr::HeaderCallback{
        [transfer](auto line, intptr_t /*userdata*/) -> bool {
            return transfer->on_header_line(std::string_view(line));
        }});
    session.SetWriteCallback(cpr::WriteCallback{
        [transfer](auto data, intptr_t /*userdata*/) -> bool {
            return transfer->on_body(std::string_view(data));
        }});
    // Runs periodically even on an idle stream, so cancel() is noticed promptly.
    session.SetProgressCallback(cpr::ProgressCallback{
        [transfer](auto, auto, auto, auto, intptr_t /*userdata*/) -> bool {
            return transfer->cancelled.load(std::memory_order_acquire) == false;
        }});

    if (request.body.has_value()) {
        session.SetBody(cpr::Body{*request.body});
    }

    cpr::Response response;
    switch (request.method) {
        case HttpMethod::Get:    response = session.Get(); break;
        case HttpMethod::Post:   response = session.Post(); break;
        case HttpMethod::Delete: response = session.Delete(); break;
    }

    TransferEvent finished;
    finished.kind = TransferEvent::Kind::Finished;

    if (transfer->cancelled.load(std::memory_order_acquire)) {
        finished.error = HttpClientError::cancelled();
    } else if (response.error.code != cpr::ErrorCode::OK) {
        finished.error = map_error(response.error);
    } else if (transfer->head_sent == false) {
        // Body-less responses never reach the write callback
        transfer->pending_head.status_code = static_cast<int>(response.status_code);
        for (const auto& [name, value] : response.header) {
            set_header(transfer->pending_head.headers, name, value);
        }
        if (transfer->send_head() == false) {
            finished.error = HttpClientError::cancelled();
        }
    }

    transfer->deliver(std::move(finished));
}

// ─────────────────────────────────────────────────────────────────────────────
// CprHttpStream
// ─────────────────────────────────────────────────────────────────────────────

class CprHttpStream final : public HttpStream {
public:
    CprHttpStream(HttpResponseHead head, std::shared_ptr<Transfer> transfer)
        : head_(std::move(head))
        , transfer_(std::move(transfer))
    {}

    ~CprHttpStream() override {
        cancel();
    }

    [[nodiscard]] const HttpResponseHead& head() const noexcept override {
        return head_;
    }

    asio::awaitable<HttpClientResult<std::optional<std::string>>> async_read_some() override {
        while (terminal_.has_value() == false) {
            asio::error_code ec;
            auto event = co_await transfer_->events.async_receive(
                asio::redirect_error(asio::use_awaitable, ec));
            if (ec) {
                terminal_ = tl::unexpected(HttpClientError::cancelled());
                break;
            }

            switch (event.kind) {
                case TransferEvent::Kind::Chunk:
                    co_return std::optional<std::string>(std::move(event.data));
                case TransferEvent::Kind::Finished:
                    if (event.error.has_value()) {
                        terminal_ = tl::unexpected(*event.error);
                    } else {
                        terminal_ = std::optional<std::string>{};
                    }
                    break;
                case TransferEvent::Kind::Head:
                    break;
            }
        }
        co_return *terminal_;
    }

    void cancel() override {
        transfer_->cancelled.store(true, std::memory_order_release);
        transfer_->events.close();
    }

private:
    HttpResponseHead head_;
    std::shared_ptr<Transfer> transfer_;
    std::optional<HttpClientResult<std::optional<std::string>>> terminal_;
};

// ─────────────────────────────────────────────────────────────────────────────
// CprHttpClient
// ─────────────────────────────────────────────────────────────────────────────

class CprHttpClient final : public IHttpClient {
public:
    explicit CprHttpClient(asio::any_io_executor executor)
        : executor_(std::move(executor))
    {}

    ~CprHttpClient() override {
        cancel();
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& worker : workers_) {
            worker.wait();
        }
    }

    void set_connect_timeout(std::chrono::milliseconds timeout) override {
        connect_timeout_ = timeout;
    }

    void set_verify_ssl(bool verify) override {
        verify_ssl_ = verify;
    }

    asio::awaitable<HttpClientResult<std::unique_ptr<HttpStream>>> async_open(
        HttpRequest request
    ) override {
        if (cancelled_.load()) {
            co_return tl::unexpected(HttpClientError::cancelled());
        }

        // Completions must land on the caller's executor (normally a strand)
        auto executor = co_await asio::this_coro::executor;
        auto transfer = std::make_shared<Transfer>(executor, kChannelCapacity);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            reap_finished_workers();
            active_.push_back(transfer);
            workers_.push_back(std::async(
                std::launch::async,
                [transfer, request = std::move(request), timeout = connect_timeout_, verify = verify_ssl_]() {
                    run_transfer(transfer, request, timeout, verify);
                }
            ));
        }

        asio::error_code ec;
        auto first = co_await transfer->events.async_receive(
            asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            co_return tl::unexpected(HttpClientError::cancelled());
        }

        if (first.kind != TransferEvent::Kind::Head) {
            transfer->cancelled.store(true);
            transfer->events.close();
            co_return tl::unexpected(first.error.value_or(
                HttpClientError::unknown("Connection closed before a response was received")));
        }

        co_return std::unique_ptr<HttpStream>(
            std::make_unique<CprHttpStream>(std::move(first.head), std::move(transfer)));
    }

    void cancel() override {
        cancelled_.store(true);
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& weak : active_) {
            if (auto transfer = weak.lock()) {
                transfer->cancelled.store(true, std::memory_order_release);
                transfer->events.close();
            }
        }
        active_.clear();
    }

    void reset() override {
        cancelled_.store(false);
    }

private:
    // Caller holds mutex_
    void reap_finished_workers() {
        std::erase_if(workers_, [](std::future<void>& worker) {
            return worker.wait_for(std::chrono::seconds{0}) == std::future_status::ready;
        });
        std::erase_if(active_, [](const std::weak_ptr<Transfer>& weak) {
            return weak.expired();
        });
    }

    asio::any_io_executor executor_;
    std::chrono::milliseconds connect_timeout_{10'000};
    bool verify_ssl_{true};
    std::atomic<bool> cancelled_{false};

    std::mutex mutex_;
    std::vector<std::future<void>> workers_;
    std::vector<std::weak_ptr<Transfer>> active_;
};

}  // namespace

std::unique_ptr<IHttpClient> make_http_client(asio::any_io_executor executor) {
    return std::make_unique<CprHttpClient>(std::move(executor));
}

}  // namespace mcplink
