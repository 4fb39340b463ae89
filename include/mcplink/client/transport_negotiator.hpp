#pragma once

#include "mcplink/client/connection_config.hpp"
#include "mcplink/protocol/json_rpc.hpp"
#include "mcplink/transport/http_client.hpp"
#include "mcplink/transport/transport_error.hpp"
#include "mcplink/transport/transport_kind.hpp"

#include <asio/awaitable.hpp>

#include <memory>
#include <optional>
#include <string>

namespace mcplink {

/// A transport decision plus the stream that carries inbound traffic: the
/// initialize response for Streamable HTTP, the long-lived GET for HTTP+SSE.
struct EstablishedStream {
    NegotiatedTransport transport;
    std::unique_ptr<HttpStream> stream;
};

// ─────────────────────────────────────────────────────────────────────────────
// TransportNegotiator
// ─────────────────────────────────────────────────────────────────────────────
// Finds out which transport a server speaks without prior knowledge:
//
//   POST initialize ──2xx──▶ Streamable (session id from the response header)
//        │
//        └──405──▶ GET (Accept: text/event-stream) ──2xx──▶ HTTP+SSE
//
// Any other status is classified with classify_http_failure(). Also builds
// the requests used after negotiation so every request carries the same
// authentication and protocol headers.

class TransportNegotiator {
public:
    TransportNegotiator(const ConnectionConfig& config, IHttpClient& http);

    [[nodiscard]] asio::awaitable<HttpResult<EstablishedStream>> negotiate(
        const Json& initialize_request,
        const std::optional<std::string>& last_event_id
    );

    /// POST of one JSON-RPC message to `url` over the negotiated transport.
    [[nodiscard]] HttpRequest build_post(
        const std::string& url,
        const Json& message,
        const NegotiatedTransport& transport
    ) const;

    /// GET that opens an HTTP+SSE stream.
    [[nodiscard]] HttpRequest build_stream_request(
        const std::optional<std::string>& last_event_id
    ) const;

    /// First configured session header present on the response, validated.
    [[nodiscard]] StreamableTransport streamable_from(const HttpResponseHead& head) const;

private:
    [[nodiscard]] asio::awaitable<HttpResult<EstablishedStream>> open_legacy_stream(
        const std::optional<std::string>& last_event_id
    );

    [[nodiscard]] static asio::awaitable<HttpTransportError> classify_failure(HttpStream& stream);

    void apply_common_headers(HttpRequest& request, const std::string& protocol_version) const;

    const ConnectionConfig& config_;
    IHttpClient& http_;
};

}  // namespace mcplink
