#include "mcplink/client/mcp_connection.hpp"

#include "mcplink/log/logger.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/redirect_error.hpp>
#include <asio/use_awaitable.hpp>

#include <algorithm>
#include <format>
#include <iterator>

namespace mcplink {

namespace {

constexpr std::size_t kMaxErrorBodySize = 64 * 1024;
constexpr std::size_t kMaxToolPages = 100;

/// Run `work` on the connection's strand and resume the caller on its own
/// executor. Exceptions are turned into errors at this boundary.
template <typename T>
asio::awaitable<ClientResult<T>> run_on(
    asio::strand<asio::any_io_executor> strand,
    asio::awaitable<ClientResult<T>> work,
    const char* operation
) {
    try {
        co_return co_await asio::co_spawn(strand, std::move(work), asio::use_awaitable);
    } catch (const std::exception& e) {
        MCPLINK_LOG_ERROR(std::string(operation) + " failed: " + e.what());
        co_return tl::unexpected(ClientError::transport_error(std::string(operation) + " failed: " + e.what()));
    }
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════════════

std::shared_ptr<McpConnection> McpConnection::create(
    asio::any_io_executor executor,
    ConnectionConfig config,
    std::unique_ptr<IHttpClient> http
) {
    if (!http) {
        http = make_http_client(executor);
    }
    return std::shared_ptr<McpConnection>(
        new McpConnection(std::move(executor), std::move(config), std::move(http)));
}

McpConnection::McpConnection(
    asio::any_io_executor executor,
    ConnectionConfig config,
    std::unique_ptr<IHttpClient> http
)
    : strand_(asio::make_strand(executor))
    , config_(std::move(config))
    , http_(std::move(http))
    , backoff_(config_.backoff_policy
          ? config_.backoff_policy
          : std::make_shared<ExponentialBackoff>(
                config_.reconnect.min_delay,
                config_.reconnect.multiplier,
                config_.reconnect.max_delay))
    , state_(config_.server_id)
    , correlator_(strand_, config_.server_id, config_.request_timeout)
    , negotiator_(config_, *http_)
    , reconnect_timer_(strand_)
{
    http_->set_connect_timeout(config_.connect_timeout);
    http_->set_verify_ssl(config_.verify_ssl);
}

McpConnection::~McpConnection() {
    reconnect_timer_.cancel();
    for (auto& waiter : endpoint_waiters_) {
        waiter->cancel();
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Public API
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<ClientResult<InitializeResult>> McpConnection::connect() {
    auto self = shared_from_this();
    co_return co_await run_on(strand_, self->connect_on_strand(), "connect");
}

asio::awaitable<void> McpConnection::disconnect() {
    auto self = shared_from_this();
    try {
        co_await asio::co_spawn(strand_, self->disconnect_on_strand(), asio::use_awaitable);
    } catch (const std::exception& e) {
        MCPLINK_LOG_ERROR("disconnect failed: " + std::string(e.what()));
    }
}

asio::awaitable<ClientResult<Json>> McpConnection::send_request(
    std::string method,
    std::optional<Json> params
) {
    auto self = shared_from_this();
    co_return co_await run_on(strand_, self->request_on_strand(std::move(method), std::move(params)), "send_request");
}

asio::awaitable<ClientResult<void>> McpConnection::send_notification(
    std::string method,
    std::optional<Json> params
) {
    auto self = shared_from_this();
    co_return co_await run_on(strand_, self->notify_on_strand(std::move(method), std::move(params)), "send_notification");
}

asio::awaitable<ClientResult<std::vector<Tool>>> McpConnection::list_tools() {
    auto self = shared_from_this();
    co_return co_await run_on(strand_, self->cached_tools(), "list_tools");
}

asio::awaitable<ClientResult<std::vector<Tool>>> McpConnection::refresh_tools() {
    auto self = shared_from_this();
    co_return co_await run_on(strand_, self->fetch_tools(), "refresh_tools");
}

asio::awaitable<ClientResult<CallToolResult>> McpConnection::call_tool(
    std::string name,
    Json arguments
) {
    auto self = shared_from_this();
    co_return co_await run_on(strand_, self->call_tool_on_strand(std::move(name), std::move(arguments)), "call_tool");
}

ServerStatus McpConnection::status() const {
    return state_.status();
}

std::optional<InitializeResult> McpConnection::server_info() const {
    std::lock_guard<std::mutex> lock(info_mutex_);
    return server_info_;
}

std::optional<std::string> McpConnection::session_id() const {
    std::lock_guard<std::mutex> lock(info_mutex_);
    return session_id_;
}

TransportKind McpConnection::transport_kind() const {
    return state_.status().transport;
}

std::size_t McpConnection::dropped_response_count() const noexcept {
    return dropped_responses_.load();
}

void McpConnection::on_status_change(StatusCallback callback) {
    state_.on_status_change(std::move(callback));
}

void McpConnection::on_message(MessageCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    message_callbacks_.push_back(std::move(callback));
}

void McpConnection::on_reconnect_scheduled(ReconnectCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    reconnect_callbacks_.push_back(std::move(callback));
}

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle (strand)
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<ClientResult<InitializeResult>> McpConnection::connect_on_strand() {
    auto valid = config_.validate();
    if (!valid) {
        co_return tl::unexpected(ClientError::transport_error("Invalid configuration: " + valid.error().message));
    }

    const bool started = state_.begin_connect();
    if (started == false) {
        co_return tl::unexpected(ClientError::not_connected("Connection already established or in progress"));
    }

    // A manual connect supersedes any scheduled retry
    reconnect_timer_.cancel();
    reconnect_pending_ = false;
    reconnect_attempt_ = 0;
    retry_hint_.reset();
    stream_retry_.reset();
    backoff_->reset();

    const auto generation = ++generation_;
    co_return co_await establish(generation);
}

asio::awaitable<void> McpConnection::disconnect_on_strand() {
    stop_activity();
    http_->cancel();

    const auto changed = state_.disconnected();
    const auto rejected = correlator_.reject_all(ClientError::disconnected());

    reconnect_attempt_ = 0;
    last_event_id_.reset();
    retry_hint_.reset();
    stream_retry_.reset();
    {
        std::lock_guard<std::mutex> lock(info_mutex_);
        server_info_.reset();
    }

    if (changed || rejected > 0) {
        get_logger().info_fmt("[{}] Disconnected ({} pending request(s) rejected)", config_.server_id, rejected);
    }
    co_return;
}

asio::awaitable<ClientResult<InitializeResult>> McpConnection::establish(std::uint64_t generation) {
    http_->reset();

    const auto init_id = correlator_.next_id();
    auto ticket = correlator_.track(init_id, method::Initialize);
    handshake_id_ = init_id;

    InitializeParams params;
    params.protocol_version = config_.protocol_version;
    params.client_info = config_.client_info;
    const JsonRpcRequest probe(method::Initialize, static_cast<std::int64_t>(init_id), params.to_json());

    auto negotiated = co_await negotiator_.negotiate(probe.to_json(), last_event_id_);
    if (generation != generation_) {
        co_return tl::unexpected(ClientError::disconnected());
    }
    if (!negotiated) {
        const auto error = negotiated.error();
        if (error.is_auth_failure()) {
            fail_auth(generation, error);
        } else {
            fail_connection(generation, error);
        }
        co_return tl::unexpected(ClientError::from_transport_error(error));
    }

    transport_ = std::move(negotiated->transport);
    publish_session();

    std::shared_ptr<HttpStream> stream = std::move(negotiated->stream);
    active_stream_ = stream;
    state_.connection_established(kind_of(transport_));

    asio::co_spawn(strand_,
        [self = shared_from_this(), stream, generation]() {
            return self->read_stream(stream, generation);
        },
        asio::detached);

    // HTTP+SSE: the stream is open, the handshake goes to the announced endpoint
    if (kind_of(transport_) == TransportKind::LegacySse) {
        auto legacy_params = InitializeParams::legacy(config_.client_info);
        legacy_params.protocol_version = config_.legacy_protocol_version;
        const JsonRpcRequest handshake(method::Initialize, static_cast<std::int64_t>(init_id), legacy_params.to_json());

        auto sent = co_await transmit(handshake.to_json(), init_id, generation);
        if (!sent && generation == generation_) {
            if (sent.error().is_auth_failure()) {
                fail_auth(generation, sent.error());
            } else {
                fail_connection(generation, sent.error());
            }
        }
    }

    auto reply = co_await RequestCorrelator::await_reply(ticket);
    handshake_id_.reset();
    if (!reply) {
        if (generation == generation_) {
            const auto error = (reply.error().code == ClientErrorCode::Timeout)
                ? HttpTransportError::timeout(reply.error().message)
                : HttpTransportError::invalid_response("initialize failed: " + reply.error().message);
            fail_connection(generation, error);
        }
        co_return tl::unexpected(reply.error());
    }
    if (generation != generation_) {
        co_return tl::unexpected(ClientError::disconnected());
    }

    if (reply->is_object() == false) {
        const auto error = HttpTransportError::invalid_response("initialize returned a malformed result");
        fail_connection(generation, error);
        co_return tl::unexpected(ClientError::from_transport_error(error));
    }

    auto init = InitializeResult::from_json(*reply);
    {
        std::lock_guard<std::mutex> lock(info_mutex_);
        server_info_ = init;
    }

    // Only a completed handshake counts as success for backoff purposes
    reconnect_attempt_ = 0;
    backoff_->reset();
    retry_hint_.reset();

    get_logger().info_fmt("[{}] Connected to {} {} over {} (protocol {})",
                          config_.server_id,
                          init.server_info.name,
                          init.server_info.version,
                          to_string(kind_of(transport_)),
                          init.protocol_version);

    const JsonRpcNotification initialized(method::Initialized);
    auto notified = co_await transmit(initialized.to_json(), std::nullopt, generation);
    if (!notified) {
        get_logger().warn_fmt("[{}] Failed to send initialized notification: {}",
                              config_.server_id, notified.error().message);
        handle_transmit_failure(generation, notified.error());
    }

    if (config_.fetch_tools_on_connect && (generation == generation_)) {
        auto tools = co_await fetch_tools();
        if (!tools) {
            get_logger().warn_fmt("[{}] Tool discovery failed: {}", config_.server_id, tools.error().message);
        } else {
            get_logger().info_fmt("[{}] Discovered {} tool(s)", config_.server_id, tools->size());
        }
    }

    co_return init;
}

asio::awaitable<void> McpConnection::reconnect() {
    const bool started = state_.begin_connect();
    if (started == false) {
        co_return;
    }

    const auto generation = ++generation_;
    get_logger().info_fmt("[{}] Reconnecting (attempt {})", config_.server_id, reconnect_attempt_);

    try {
        auto result = co_await establish(generation);
        if (!result) {
            get_logger().warn_fmt("[{}] Reconnect attempt {} failed: {}",
                                  config_.server_id, reconnect_attempt_, result.error().message);
        }
    } catch (const std::exception& e) {
        MCPLINK_LOG_ERROR("Reconnect failed: " + std::string(e.what()));
        fail_connection(generation, HttpTransportError::invalid_response(e.what()));
    }
}

void McpConnection::schedule_reconnect() {
    if (reconnect_pending_) {
        return;
    }

    const auto max_attempts = config_.reconnect.max_attempts;
    const bool exhausted = (max_attempts > 0) && (reconnect_attempt_ >= max_attempts);
    if (exhausted) {
        const auto message = std::format("Connection failed after {} attempts", reconnect_attempt_);
        get_logger().error_fmt("[{}] {}", config_.server_id, message);
        state_.connection_failed(message);
        return;
    }

    // Server hints raise the delay but never past max_delay
    auto delay = backoff_->next_delay(reconnect_attempt_);
    for (const auto& hint : {retry_hint_, stream_retry_}) {
        if (hint.has_value()) {
            delay = std::max(delay, std::min(*hint, config_.reconnect.max_delay));
        }
    }
    ++reconnect_attempt_;
    reconnect_pending_ = true;

    get_logger().info_fmt("[{}] Reconnect attempt {} in {}ms",
                          config_.server_id, reconnect_attempt_, delay.count());

    std::vector<ReconnectCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callbacks = reconnect_callbacks_;
    }
    for (const auto& callback : callbacks) {
        try {
            callback(reconnect_attempt_, delay);
        } catch (const std::exception& e) {
            MCPLINK_LOG_ERROR("Exception in reconnect callback: " + std::string(e.what()));
        }
    }

    reconnect_timer_.expires_after(delay);
    reconnect_timer_.async_wait(
        [self = shared_from_this(), generation = generation_](asio::error_code ec) {
            if (ec || (generation != self->generation_)) {
                return;
            }
            self->reconnect_pending_ = false;
            asio::co_spawn(self->strand_,
                [self]() { return self->reconnect(); },
                asio::detached);
        });
}

void McpConnection::stop_activity() {
    ++generation_;

    reconnect_timer_.cancel();
    reconnect_pending_ = false;
    wake_endpoint_waiters();

    if (active_stream_) {
        active_stream_->cancel();
        active_stream_.reset();
    }

    transport_ = std::monostate{};
    tools_cache_.reset();
    publish_session();
}

void McpConnection::fail_connection(std::uint64_t generation, const HttpTransportError& error) {
    if (generation != generation_) {
        return;
    }

    if (error.retryable()) {
        get_logger().warn_fmt("[{}] Connection failed: {}", config_.server_id, error.message);
    } else {
        get_logger().error_fmt("[{}] Connection failed: {}", config_.server_id, error.message);
    }
    stop_activity();

    if (error.retry_after.has_value()) {
        retry_hint_ = std::max(retry_hint_.value_or(std::chrono::milliseconds{0}), *error.retry_after);
    }

    state_.connection_failed(error.message);
    correlator_.reject_all(ClientError::transport_error(error.message));
    schedule_reconnect();
}

void McpConnection::fail_auth(std::uint64_t generation, const HttpTransportError& error) {
    if (generation != generation_) {
        return;
    }

    const auto failure = error.auth_failure.value_or(AuthFailure::Rejected);
    get_logger().error_fmt("[{}] Authentication failed ({}): {}",
                           config_.server_id, to_string(failure), error.message);
    stop_activity();

    state_.auth_failed(failure, error.message);
    correlator_.reject_all(ClientError::unauthorized(error.message));
}

void McpConnection::handle_transmit_failure(std::uint64_t generation, const HttpTransportError& error) {
    if (error.is_auth_failure()) {
        fail_auth(generation, error);
        return;
    }
    if (error.code == HttpTransportError::Code::SessionExpired) {
        fail_connection(generation, error);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Outbound (strand)
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<ClientResult<Json>> McpConnection::request_on_strand(
    std::string method,
    std::optional<Json> params
) {
    const bool ready =
        (kind_of(transport_) != TransportKind::Unknown) &&
        (state_.state() == ConnectionState::Connected);
    if (ready == false) {
        co_return tl::unexpected(ClientError::not_connected());
    }

    const auto generation = generation_;
    const auto id = correlator_.next_id();
    auto ticket = correlator_.track(id, method);
    const JsonRpcRequest request(std::move(method), static_cast<std::int64_t>(id), std::move(params));

    // The POST runs on its own so a stalled exchange cannot outlive the timeout
    asio::co_spawn(strand_,
        [self = shared_from_this(), message = request.to_json(), id, generation]() mutable {
            return self->transmit_request(std::move(message), id, generation);
        },
        asio::detached);

    co_return co_await RequestCorrelator::await_reply(std::move(ticket));
}

asio::awaitable<ClientResult<void>> McpConnection::notify_on_strand(
    std::string method,
    std::optional<Json> params
) {
    const bool ready =
        (kind_of(transport_) != TransportKind::Unknown) &&
        (state_.state() == ConnectionState::Connected);
    if (ready == false) {
        co_return tl::unexpected(ClientError::not_connected());
    }

    const auto generation = generation_;
    const JsonRpcNotification notification(std::move(method), std::move(params));
    auto sent = co_await transmit(notification.to_json(), std::nullopt, generation);
    if (!sent) {
        handle_transmit_failure(generation, sent.error());
        co_return tl::unexpected(ClientError::from_transport_error(sent.error()));
    }
    co_return ClientResult<void>{};
}

asio::awaitable<void> McpConnection::transmit_request(
    Json message,
    std::uint64_t id,
    std::uint64_t generation
) {
    auto sent = co_await transmit(std::move(message), id, generation);
    if (!sent) {
        handle_transmit_failure(generation, sent.error());
        correlator_.reject(id, ClientError::from_transport_error(sent.error()));
    }
}

asio::awaitable<void> McpConnection::transmit_detached(Json message, std::uint64_t generation) {
    auto sent = co_await transmit(std::move(message), std::nullopt, generation);
    if (!sent) {
        get_logger().warn_fmt("[{}] Failed to answer server request: {}", config_.server_id, sent.error().message);
        handle_transmit_failure(generation, sent.error());
    }
}

asio::awaitable<HttpResult<void>> McpConnection::transmit(
    Json message,
    std::optional<std::uint64_t> reply_id,
    std::uint64_t generation
) {
    if (kind_of(transport_) == TransportKind::LegacySse) {
        auto ready = co_await await_endpoint(generation);
        if (!ready) {
            co_return tl::unexpected(ready.error());
        }
    }
    if (generation != generation_) {
        co_return tl::unexpected(HttpTransportError::closed());
    }

    const auto target = post_target(transport_, config_.url);
    if (target.has_value() == false) {
        co_return tl::unexpected(HttpTransportError::closed());
    }

    const bool is_streamable = (kind_of(transport_) == TransportKind::Streamable);
    const bool had_session = session_header(transport_).has_value();

    auto opened = co_await http_->async_open(negotiator_.build_post(*target, message, transport_));
    if (generation != generation_) {
        co_return tl::unexpected(HttpTransportError::closed());
    }
    if (!opened) {
        co_return tl::unexpected(HttpTransportError::from_client_error(opened.error()));
    }

    std::unique_ptr<HttpStream> response = std::move(*opened);
    const HttpResponseHead head = response->head();

    if (head.is_success() == false) {
        auto body = co_await response->async_read_prefix(kMaxErrorBodySize);
        if (is_streamable && had_session && (head.status_code == 404)) {
            co_return tl::unexpected(HttpTransportError::session_expired());
        }
        co_return tl::unexpected(classify_http_failure(head.status_code, head.headers, body.value_or(std::string{})));
    }

    FrameDecoder decoder;

    if (head.is_sse()) {
        if (reply_id.has_value() == false) {
            response->cancel();
            co_return HttpResult<void>{};
        }

        // Dispatch everything, stop once our reply has gone by
        SseParser parser(config_.parser);
        bool answered = false;
        bool finished = false;
        while ((answered == false) && (finished == false)) {
            auto chunk = co_await response->async_read_some();
            if (generation != generation_) {
                co_return tl::unexpected(HttpTransportError::closed());
            }
            if (!chunk) {
                co_return tl::unexpected(HttpTransportError::from_client_error(chunk.error()));
            }

            std::vector<SseEvent> events;
            finished = (chunk->has_value() == false);
            if (finished) {
                events = parser.finish();
            } else {
                try {
                    events = parser.feed(**chunk);
                } catch (const SseBufferOverflowError& e) {
                    response->cancel();
                    co_return tl::unexpected(HttpTransportError::invalid_response(e.what()));
                }
            }

            for (const auto& event : events) {
                for (const auto& frame : decoder.decode(event)) {
                    const auto* message_frame = std::get_if<MessageFrame>(&frame);
                    if (message_frame == nullptr) {
                        continue;
                    }
                    if (response_id(message_frame->message) == reply_id) {
                        answered = true;
                    }
                    dispatch_inbound(message_frame->message);
                }
            }
        }
        response->cancel();

        if ((answered == false) && is_streamable) {
            co_return tl::unexpected(HttpTransportError::invalid_response("Response stream ended without a reply"));
        }
        co_return HttpResult<void>{};
    }

    auto body = co_await response->async_read_all();
    if (generation != generation_) {
        co_return tl::unexpected(HttpTransportError::closed());
    }
    if (!body) {
        co_return tl::unexpected(HttpTransportError::from_client_error(body.error()));
    }

    if (head.is_json()) {
        for (const auto& frame : decoder.decode_document(*body)) {
            if (const auto* message_frame = std::get_if<MessageFrame>(&frame)) {
                dispatch_inbound(message_frame->message);
            }
        }
        co_return HttpResult<void>{};
    }

    const bool accepted = (head.status_code == 202) || body->empty();
    if (accepted) {
        co_return HttpResult<void>{};
    }
    co_return tl::unexpected(HttpTransportError::invalid_response(
        "Unexpected content type: " + head.header("Content-Type").value_or("<none>")));
}

asio::awaitable<HttpResult<void>> McpConnection::await_endpoint(std::uint64_t generation) {
    const auto deadline = std::chrono::steady_clock::now() + config_.endpoint_timeout;

    while (true) {
        if (generation != generation_) {
            co_return tl::unexpected(HttpTransportError::closed());
        }
        const auto* legacy = std::get_if<LegacySseTransport>(&transport_);
        if (legacy == nullptr) {
            co_return tl::unexpected(HttpTransportError::closed());
        }
        if (legacy->endpoint.has_value()) {
            co_return HttpResult<void>{};
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            co_return tl::unexpected(HttpTransportError::endpoint_timeout(config_.endpoint_timeout));
        }

        auto waiter = std::make_shared<asio::steady_timer>(strand_, deadline);
        endpoint_waiters_.push_back(waiter);
        asio::error_code ec;
        co_await waiter->async_wait(asio::redirect_error(asio::use_awaitable, ec));
        std::erase(endpoint_waiters_, waiter);
    }
}

void McpConnection::wake_endpoint_waiters() {
    for (auto& waiter : endpoint_waiters_) {
        waiter->cancel();
    }
    endpoint_waiters_.clear();
}

// ═══════════════════════════════════════════════════════════════════════════
// Inbound (strand)
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<void> McpConnection::read_stream(std::shared_ptr<HttpStream> stream, std::uint64_t generation) {
    const auto is_current = [&]() {
        return (generation == generation_) && (active_stream_ == stream);
    };

    FrameDecoder decoder;
    std::optional<std::string> failure;

    if (stream->head().is_sse() == false) {
        // Streamable server answered initialize with a plain JSON document
        auto body = co_await stream->async_read_all();
        if (is_current() == false) {
            co_return;
        }
        if (!body) {
            failure = body.error().message;
        } else {
            for (const auto& frame : decoder.decode_document(*body)) {
                if (const auto* message_frame = std::get_if<MessageFrame>(&frame)) {
                    dispatch_inbound(message_frame->message);
                }
                if (is_current() == false) {
                    co_return;
                }
            }
        }
    } else {
        SseParser parser(config_.parser);
        while (true) {
            auto chunk = co_await stream->async_read_some();
            if (is_current() == false) {
                co_return;
            }
            if (!chunk) {
                failure = chunk.error().message;
                break;
            }

            const bool finished = (chunk->has_value() == false);
            std::vector<SseEvent> events;
            if (finished) {
                events = parser.finish();
            } else {
                try {
                    events = parser.feed(**chunk);
                } catch (const SseBufferOverflowError& e) {
                    failure = e.what();
                    stream->cancel();
                    break;
                }
            }

            for (const auto& event : events) {
                handle_event(event, decoder);
                if (is_current() == false) {
                    co_return;
                }
            }
            if (finished) {
                break;
            }
        }
    }

    active_stream_.reset();

    if (reconnects_on_stream_end(transport_)) {
        const std::string reason = failure.value_or("SSE stream closed by server");
        fail_connection(generation, HttpTransportError::connection_failed(reason));
        co_return;
    }

    // A Streamable initialize response that ends unanswered fails the handshake now
    if (handshake_id_.has_value()) {
        correlator_.reject(*handshake_id_, ClientError::protocol_error(
            failure.value_or("initialize response ended without a reply")));
    }

    if (failure.has_value()) {
        get_logger().warn_fmt("[{}] Response stream failed: {}", config_.server_id, *failure);
    } else {
        get_logger().debug_fmt("[{}] Response stream ended", config_.server_id);
    }
}

void McpConnection::handle_event(const SseEvent& event, FrameDecoder& decoder) {
    if (event.id.has_value()) {
        last_event_id_ = event.id;
    }
    if (event.retry.has_value()) {
        stream_retry_ = std::chrono::milliseconds{*event.retry};
    }

    for (const auto& frame : decoder.decode(event)) {
        if (const auto* endpoint = std::get_if<EndpointFrame>(&frame)) {
            handle_endpoint(endpoint->endpoint);
        } else if (const auto* message_frame = std::get_if<MessageFrame>(&frame)) {
            dispatch_inbound(message_frame->message);
        }
    }
}

void McpConnection::handle_endpoint(const std::string& endpoint) {
    auto* legacy = std::get_if<LegacySseTransport>(&transport_);
    if (legacy == nullptr) {
        get_logger().warn_fmt("[{}] Ignoring endpoint event on a {} transport",
                              config_.server_id, to_string(kind_of(transport_)));
        return;
    }

    auto resolved = resolve_url(config_.url, endpoint);
    if (resolved.has_value() == false) {
        get_logger().warn_fmt("[{}] Ignoring invalid endpoint '{}'", config_.server_id, endpoint);
        return;
    }

    auto session = endpoint_session_id(*resolved);
    if (session.has_value() && (is_valid_session_id(*session) == false)) {
        get_logger().warn_fmt("[{}] Ignoring invalid session id in endpoint", config_.server_id);
        session.reset();
    }

    legacy->endpoint = std::move(*resolved);
    legacy->session_id = std::move(session);
    publish_session();

    get_logger().info_fmt("[{}] Message endpoint: {}", config_.server_id, *legacy->endpoint);
    wake_endpoint_waiters();
}

void McpConnection::dispatch_inbound(const Json& message) {
    std::vector<MessageCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callbacks = message_callbacks_;
    }
    for (const auto& callback : callbacks) {
        try {
            callback(message);
        } catch (const std::exception& e) {
            MCPLINK_LOG_ERROR("Exception in message callback: " + std::string(e.what()));
        }
    }

    switch (classify_message(message)) {
        case MessageKind::Response: {
            const auto id = response_id(message);
            const bool resolved = id.has_value() && correlator_.resolve(*id, message);
            if (resolved == false) {
                dropped_responses_.fetch_add(1);
                get_logger().warn_fmt("[{}] Dropping response for unknown request id {}",
                                      config_.server_id, message.value("id", Json{}).dump());
            }
            break;
        }
        case MessageKind::Request:
            answer_server_request(message);
            break;
        case MessageKind::Notification:
            get_logger().debug_fmt("[{}] Notification {}", config_.server_id, message.value("method", ""));
            break;
        case MessageKind::Invalid:
            get_logger().warn_fmt("[{}] Ignoring invalid JSON-RPC message", config_.server_id);
            break;
    }
}

void McpConnection::answer_server_request(const Json& message) {
    auto request = JsonRpcRequest::from_json(message);
    if (!request) {
        get_logger().warn_fmt("[{}] Malformed server request: {}", config_.server_id, request.error().message);
        return;
    }

    Json reply;
    if (request->method() == method::Ping) {
        reply = make_result_response(request->id(), Json::object());
    } else {
        get_logger().debug_fmt("[{}] Rejecting unsupported server request {}", config_.server_id, request->method());
        reply = make_error_response(request->id(),
            JsonRpcError{rpc_error_code::MethodNotFound, "Method not found: " + request->method()});
    }

    asio::co_spawn(strand_,
        [self = shared_from_this(), reply = std::move(reply), generation = generation_]() mutable {
            return self->transmit_detached(std::move(reply), generation);
        },
        asio::detached);
}

// ═══════════════════════════════════════════════════════════════════════════
// Tools (strand)
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<ClientResult<std::vector<Tool>>> McpConnection::cached_tools() {
    if (tools_cache_.has_value()) {
        co_return *tools_cache_;
    }
    co_return co_await fetch_tools();
}

asio::awaitable<ClientResult<std::vector<Tool>>> McpConnection::fetch_tools() {
    std::vector<Tool> tools;
    std::optional<std::string> cursor;

    for (std::size_t page = 0; page < kMaxToolPages; ++page) {
        std::optional<Json> params;
        if (cursor.has_value()) {
            params = Json::object();
            (*params)["cursor"] = *cursor;
        }

        auto reply = co_await request_on_strand(method::ListTools, std::move(params));
        if (!reply) {
            co_return tl::unexpected(reply.error());
        }

        if (reply->is_object() == false) {
            co_return tl::unexpected(ClientError::protocol_error("tools/list returned a malformed result"));
        }
        auto result = ListToolsResult::from_json(*reply);
        std::move(result.tools.begin(), result.tools.end(), std::back_inserter(tools));
        cursor = std::move(result.next_cursor);
        if (cursor.has_value() == false) {
            break;
        }
    }
    if (cursor.has_value()) {
        get_logger().warn_fmt("[{}] tools/list still paging after {} pages; keeping what was fetched",
                              config_.server_id, kMaxToolPages);
    }

    tools_cache_ = tools;
    state_.set_tools(tools);
    co_return tools;
}

asio::awaitable<ClientResult<CallToolResult>> McpConnection::call_tool_on_strand(
    std::string name,
    Json arguments
) {
    const CallToolParams params{std::move(name), std::move(arguments)};
    auto reply = co_await request_on_strand(method::CallTool, params.to_json());
    if (!reply) {
        co_return tl::unexpected(reply.error());
    }
    if (reply->is_object() == false) {
        co_return tl::unexpected(ClientError::protocol_error("tools/call returned a malformed result"));
    }
    co_return CallToolResult::from_json(*reply);
}

void McpConnection::publish_session() {
    auto id = mcplink::session_id(transport_);
    std::lock_guard<std::mutex> lock(info_mutex_);
    session_id_ = std::move(id);
}

}  // namespace mcplink
