#include "mcplink/client/transport_negotiator.hpp"

#include "mcplink/log/logger.hpp"

namespace mcplink {

namespace {

constexpr std::size_t kMaxErrorBodySize = 64 * 1024;
constexpr const char* kAcceptBoth = "application/json, text/event-stream";
constexpr const char* kAcceptStream = "text/event-stream";

}  // namespace

TransportNegotiator::TransportNegotiator(const ConnectionConfig& config, IHttpClient& http)
    : config_(config)
    , http_(http)
{}

// ─────────────────────────────────────────────────────────────────────────────
// Negotiation
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<HttpResult<EstablishedStream>> TransportNegotiator::negotiate(
    const Json& initialize_request,
    const std::optional<std::string>& last_event_id
) {
    // initialize never carries a session header
    HttpRequest probe = build_post(config_.url, initialize_request, NegotiatedTransport{});
    probe.with_header("Cache-Control", "no-cache");

    get_logger().debug_fmt("[{}] POST initialize to {}", config_.server_id, config_.url);
    auto opened = co_await http_.async_open(std::move(probe));
    if (!opened) {
        co_return tl::unexpected(HttpTransportError::from_client_error(opened.error()));
    }

    std::unique_ptr<HttpStream> stream = std::move(*opened);
    const int status = stream->status_code();

    if (stream->head().is_success()) {
        auto transport = streamable_from(stream->head());
        get_logger().info_fmt("[{}] Using Streamable HTTP transport{}",
                              config_.server_id,
                              transport.session_id ? " (session " + *transport.session_id + ")" : "");
        co_return EstablishedStream{std::move(transport), std::move(stream)};
    }

    if (status == 405) {
        stream->cancel();
        get_logger().info_fmt("[{}] POST not allowed, falling back to HTTP+SSE", config_.server_id);
        co_return co_await open_legacy_stream(last_event_id);
    }

    co_return tl::unexpected(co_await classify_failure(*stream));
}

asio::awaitable<HttpResult<EstablishedStream>> TransportNegotiator::open_legacy_stream(
    const std::optional<std::string>& last_event_id
) {
    auto opened = co_await http_.async_open(build_stream_request(last_event_id));
    if (!opened) {
        co_return tl::unexpected(HttpTransportError::from_client_error(opened.error()));
    }

    std::unique_ptr<HttpStream> stream = std::move(*opened);
    if (stream->head().is_success() == false) {
        co_return tl::unexpected(co_await classify_failure(*stream));
    }

    if (stream->head().is_sse() == false) {
        const auto content_type = stream->head().header("Content-Type").value_or("<none>");
        stream->cancel();
        co_return tl::unexpected(HttpTransportError::invalid_response(
            "Expected text/event-stream from SSE endpoint, got " + content_type));
    }

    get_logger().info_fmt("[{}] Opened HTTP+SSE stream", config_.server_id);
    co_return EstablishedStream{LegacySseTransport{}, std::move(stream)};
}

asio::awaitable<HttpTransportError> TransportNegotiator::classify_failure(HttpStream& stream) {
    const int status = stream.status_code();
    auto body = co_await stream.async_read_prefix(kMaxErrorBodySize);
    const std::string text = body.value_or(std::string{});
    co_return classify_http_failure(status, stream.head().headers, text);
}

// ─────────────────────────────────────────────────────────────────────────────
// Request Building
// ─────────────────────────────────────────────────────────────────────────────

void TransportNegotiator::apply_common_headers(
    HttpRequest& request,
    const std::string& protocol_version
) const {
    for (const auto& [name, value] : config_.headers) {
        request.with_header(name, value);
    }
    if (config_.bearer_token.has_value()) {
        request.with_header("Authorization", "Bearer " + *config_.bearer_token);
    }
    request.with_header("MCP-Protocol-Version", protocol_version);
}

HttpRequest TransportNegotiator::build_post(
    const std::string& url,
    const Json& message,
    const NegotiatedTransport& transport
) const {
    const bool is_legacy = (kind_of(transport) == TransportKind::LegacySse);

    HttpRequest request;
    request.method = HttpMethod::Post;
    request.url = url;
    apply_common_headers(request, is_legacy ? config_.legacy_protocol_version : config_.protocol_version);
    request.with_header("Content-Type", "application/json");
    request.with_header("Accept", kAcceptBoth);

    if (auto header = session_header(transport)) {
        request.with_header(header->first, header->second);
    }

    request.with_body(message.dump());
    return request;
}

HttpRequest TransportNegotiator::build_stream_request(
    const std::optional<std::string>& last_event_id
) const {
    HttpRequest request;
    request.method = HttpMethod::Get;
    request.url = config_.url;
    apply_common_headers(request, config_.legacy_protocol_version);
    request.with_header("Accept", kAcceptStream);
    request.with_header("Cache-Control", "no-cache");
    if (last_event_id.has_value()) {
        request.with_header("Last-Event-ID", *last_event_id);
    }
    return request;
}

StreamableTransport TransportNegotiator::streamable_from(const HttpResponseHead& head) const {
    StreamableTransport transport;
    for (const auto& name : config_.session_header_names) {
        auto value = head.header(name);
        if (value.has_value() == false) {
            continue;
        }
        if (is_valid_session_id(*value) == false) {
            get_logger().warn_fmt("[{}] Ignoring invalid session id in {} header", config_.server_id, name);
            continue;
        }
        transport.session_id = std::move(*value);
        transport.session_header = name;
        break;
    }
    return transport;
}

}  // namespace mcplink
