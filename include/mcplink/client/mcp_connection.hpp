#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// McpConnection
// ═══════════════════════════════════════════════════════════════════════════
// One supervised connection to a remote MCP server.
//
// Features:
// - Transport negotiation (Streamable HTTP, falling back to HTTP+SSE on 405)
// - Request/response correlation with per-request timeouts
// - Exponential-backoff reconnection after transport failures
// - Tool discovery after the handshake, published on the status
//
// All state is owned by a strand. Public coroutines may be awaited from any
// executor; they hop onto the strand and back. Background work (the stream
// reader, reconnect timer, in-flight POSTs) keeps the connection alive, so
// call disconnect() before releasing the last reference.
//
// Example:
//   asio::io_context io;
//   auto connection = McpConnection::create(
//       io.get_executor(),
//       ConnectionConfig{.server_id = "docs", .url = "https://mcp.example.com/mcp"});
//
//   asio::co_spawn(io, [&]() -> asio::awaitable<void> {
//       auto init = co_await connection->connect();
//       if (!init) co_return;
//       auto tools = co_await connection->list_tools();
//       co_await connection->disconnect();
//   }, asio::detached);
//
//   io.run();

#include "mcplink/client/client_error.hpp"
#include "mcplink/client/connection_config.hpp"
#include "mcplink/client/connection_state.hpp"
#include "mcplink/client/request_correlator.hpp"
#include "mcplink/client/transport_negotiator.hpp"
#include "mcplink/protocol/mcp_types.hpp"
#include "mcplink/transport/backoff_policy.hpp"
#include "mcplink/transport/frame_decoder.hpp"
#include "mcplink/transport/http_client.hpp"
#include "mcplink/transport/transport_kind.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/steady_timer.hpp>
#include <asio/strand.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcplink {

class McpConnection : public std::enable_shared_from_this<McpConnection> {
public:
    using StatusCallback = ConnectionStateMachine::StatusCallback;

    /// Every inbound JSON-RPC message, before it is routed.
    using MessageCallback = std::function<void(const Json& message)>;

    /// A reconnect was scheduled: attempt number (from 1) and the delay before it.
    using ReconnectCallback = std::function<void(std::size_t attempt, std::chrono::milliseconds delay)>;

    /// `http` defaults to the cpr backend.
    [[nodiscard]] static std::shared_ptr<McpConnection> create(
        asio::any_io_executor executor,
        ConnectionConfig config,
        std::unique_ptr<IHttpClient> http = nullptr
    );

    ~McpConnection();

    McpConnection(const McpConnection&) = delete;
    McpConnection& operator=(const McpConnection&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /// Negotiate the transport and perform the initialize handshake. Fails
    /// with NotConnected if a connection is already established or underway.
    [[nodiscard]] asio::awaitable<ClientResult<InitializeResult>> connect();

    /// Tear everything down and reject pending requests with Disconnected.
    /// Safe at any time; repeated calls do nothing.
    asio::awaitable<void> disconnect();

    // ─────────────────────────────────────────────────────────────────────────
    // Messaging
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] asio::awaitable<ClientResult<Json>> send_request(
        std::string method,
        std::optional<Json> params = std::nullopt
    );

    [[nodiscard]] asio::awaitable<ClientResult<void>> send_notification(
        std::string method,
        std::optional<Json> params = std::nullopt
    );

    // ─────────────────────────────────────────────────────────────────────────
    // Tools
    // ─────────────────────────────────────────────────────────────────────────

    /// Cached result of the last discovery, fetching all pages if there is none.
    [[nodiscard]] asio::awaitable<ClientResult<std::vector<Tool>>> list_tools();

    /// Fetch the tool list again and publish it on the status.
    [[nodiscard]] asio::awaitable<ClientResult<std::vector<Tool>>> refresh_tools();

    [[nodiscard]] asio::awaitable<ClientResult<CallToolResult>> call_tool(
        std::string name,
        Json arguments = Json::object()
    );

    // ─────────────────────────────────────────────────────────────────────────
    // Observation (any thread)
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] ServerStatus status() const;
    [[nodiscard]] std::optional<InitializeResult> server_info() const;
    [[nodiscard]] std::optional<std::string> session_id() const;
    [[nodiscard]] TransportKind transport_kind() const;

    /// Responses whose id matched no pending request.
    [[nodiscard]] std::size_t dropped_response_count() const noexcept;

    [[nodiscard]] const ConnectionConfig& config() const noexcept { return config_; }

    void on_status_change(StatusCallback callback);
    void on_message(MessageCallback callback);
    void on_reconnect_scheduled(ReconnectCallback callback);

private:
    McpConnection(asio::any_io_executor executor, ConnectionConfig config, std::unique_ptr<IHttpClient> http);

    // Strand-side implementations of the public coroutines
    asio::awaitable<ClientResult<InitializeResult>> connect_on_strand();
    asio::awaitable<void> disconnect_on_strand();
    asio::awaitable<ClientResult<Json>> request_on_strand(std::string method, std::optional<Json> params);
    asio::awaitable<ClientResult<void>> notify_on_strand(std::string method, std::optional<Json> params);
    asio::awaitable<ClientResult<std::vector<Tool>>> cached_tools();
    asio::awaitable<ClientResult<std::vector<Tool>>> fetch_tools();
    asio::awaitable<ClientResult<CallToolResult>> call_tool_on_strand(std::string name, Json arguments);

    // Handshake and supervision
    asio::awaitable<ClientResult<InitializeResult>> establish(std::uint64_t generation);
    asio::awaitable<void> reconnect();
    void schedule_reconnect();
    void fail_connection(std::uint64_t generation, const HttpTransportError& error);
    void fail_auth(std::uint64_t generation, const HttpTransportError& error);
    void handle_transmit_failure(std::uint64_t generation, const HttpTransportError& error);
    void stop_activity();

    // Outbound
    asio::awaitable<HttpResult<void>> transmit(Json message, std::optional<std::uint64_t> reply_id, std::uint64_t generation);
    asio::awaitable<void> transmit_request(Json message, std::uint64_t id, std::uint64_t generation);
    asio::awaitable<void> transmit_detached(Json message, std::uint64_t generation);
    asio::awaitable<HttpResult<void>> await_endpoint(std::uint64_t generation);
    void wake_endpoint_waiters();

    // Inbound
    asio::awaitable<void> read_stream(std::shared_ptr<HttpStream> stream, std::uint64_t generation);
    void handle_event(const SseEvent& event, FrameDecoder& decoder);
    void handle_endpoint(const std::string& endpoint);
    void dispatch_inbound(const Json& message);
    void answer_server_request(const Json& message);

    void publish_session();

    // ─────────────────────────────────────────────────────────────────────────
    // State (strand only unless noted)
    // ─────────────────────────────────────────────────────────────────────────

    asio::strand<asio::any_io_executor> strand_;
    ConnectionConfig config_;
    std::unique_ptr<IHttpClient> http_;
    std::shared_ptr<IBackoffPolicy> backoff_;

    ConnectionStateMachine state_;          // Thread-safe
    RequestCorrelator correlator_;
    TransportNegotiator negotiator_;

    NegotiatedTransport transport_;
    std::shared_ptr<HttpStream> active_stream_;
    std::vector<std::shared_ptr<asio::steady_timer>> endpoint_waiters_;
    asio::steady_timer reconnect_timer_;

    // Bumped whenever the current attempt is abandoned; stale work checks it
    std::uint64_t generation_{0};
    std::size_t reconnect_attempt_{0};
    bool reconnect_pending_{false};
    std::optional<std::string> last_event_id_;
    std::optional<std::chrono::milliseconds> retry_hint_;     // Retry-After, until a handshake succeeds
    std::optional<std::chrono::milliseconds> stream_retry_;   // SSE retry field
    std::optional<std::uint64_t> handshake_id_;
    std::optional<std::vector<Tool>> tools_cache_;

    std::atomic<std::size_t> dropped_responses_{0};

    mutable std::mutex info_mutex_;
    std::optional<InitializeResult> server_info_;
    std::optional<std::string> session_id_;

    mutable std::mutex callback_mutex_;
    std::vector<MessageCallback> message_callbacks_;
    std::vector<ReconnectCallback> reconnect_callbacks_;
};

}  // namespace mcplink
