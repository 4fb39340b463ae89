#pragma once

#include "mcplink/json/fast_json.hpp"
#include "mcplink/transport/sse_parser.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mcplink {

using Json = nlohmann::json;

// ─────────────────────────────────────────────────────────────────────────────
// Frames
// ─────────────────────────────────────────────────────────────────────────────

/// The HTTP+SSE transport's side channel: where outbound messages must be POSTed.
struct EndpointFrame {
    std::string endpoint;   // As sent by the server; may be relative
};

/// One JSON-RPC message.
struct MessageFrame {
    Json message;
};

using Frame = std::variant<EndpointFrame, MessageFrame>;

/// Counters for frames that were read but not delivered.
struct FrameDecoderStats {
    std::size_t decoded{0};
    std::size_t skipped_non_json{0};
    std::size_t parse_failures{0};
};

// ─────────────────────────────────────────────────────────────────────────────
// FrameDecoder
// ─────────────────────────────────────────────────────────────────────────────
// Second stage of inbound parsing: turns SseEvents into protocol frames.
// Malformed payloads are logged and skipped; decode() never throws.

class FrameDecoder {
public:
    FrameDecoder() = default;
    explicit FrameDecoder(FastJsonConfig json_config) : json_(json_config) {}

    [[nodiscard]] std::vector<Frame> decode(const SseEvent& event);

    /// Decode a plain application/json body (single message or batch).
    [[nodiscard]] std::vector<Frame> decode_document(std::string_view body);

    [[nodiscard]] const FrameDecoderStats& stats() const noexcept { return stats_; }

private:
    void append_messages(std::string_view payload, std::vector<Frame>& out);

    FastJsonParser json_;
    FrameDecoderStats stats_;
};

/// Value of the sessionId query parameter of an endpoint URL, if any.
[[nodiscard]] std::optional<std::string> endpoint_session_id(std::string_view endpoint);

}  // namespace mcplink
