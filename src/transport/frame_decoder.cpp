#include "mcplink/transport/frame_decoder.hpp"

#include "mcplink/log/logger.hpp"

#include <ada.h>

namespace mcplink {

namespace {

constexpr std::string_view kEndpointEvent = "endpoint";
constexpr std::string_view kStreamTerminator = "[DONE]";
constexpr std::size_t kLogPreviewLength = 120;

std::string_view trim(std::string_view text) noexcept {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::string preview(std::string_view text) {
    if (text.size() <= kLogPreviewLength) {
        return std::string(text);
    }
    return std::string(text.substr(0, kLogPreviewLength)) + "...";
}

}  // namespace

std::vector<Frame> FrameDecoder::decode(const SseEvent& event) {
    std::vector<Frame> frames;

    const std::string_view payload = trim(event.data);

    if (event.is_type(kEndpointEvent)) {
        if (payload.empty()) {
            MCPLINK_LOG_WARN("Ignoring endpoint event with empty data");
            return frames;
        }
        ++stats_.decoded;
        frames.push_back(EndpointFrame{std::string(payload)});
        return frames;
    }

    // Keep-alives and the OpenAI-style terminator carry nothing
    const bool nothing_to_decode = payload.empty() || (payload == kStreamTerminator);
    if (nothing_to_decode) {
        return frames;
    }

    append_messages(payload, frames);
    return frames;
}

std::vector<Frame> FrameDecoder::decode_document(std::string_view body) {
    std::vector<Frame> frames;
    const std::string_view payload = trim(body);
    if (payload.empty() == false) {
        append_messages(payload, frames);
    }
    return frames;
}

void FrameDecoder::append_messages(std::string_view payload, std::vector<Frame>& out) {
    if (looks_like_json_document(payload) == false) {
        ++stats_.skipped_non_json;
        get_logger().debug_fmt("Skipping non-JSON stream payload: {}", preview(payload));
        return;
    }

    auto parsed = json_.parse(payload);
    if (!parsed) {
        ++stats_.parse_failures;
        get_logger().warn_fmt("Failed to parse stream payload ({}): {}",
                              parsed.error().message, preview(payload));
        return;
    }

    if (parsed->is_array()) {
        for (auto& element : *parsed) {
            ++stats_.decoded;
            out.push_back(MessageFrame{std::move(element)});
        }
        return;
    }

    ++stats_.decoded;
    out.push_back(MessageFrame{std::move(*parsed)});
}

std::optional<std::string> endpoint_session_id(std::string_view endpoint) {
    const auto query_start = endpoint.find('?');
    if (query_start == std::string_view::npos) {
        return std::nullopt;
    }
    std::string_view query = endpoint.substr(query_start + 1);
    const auto fragment_start = query.find('#');
    if (fragment_start != std::string_view::npos) {
        query = query.substr(0, fragment_start);
    }

    ada::url_search_params params(query);
    const auto session = params.get("sessionId");
    const bool present = session.has_value() && (session->empty() == false);
    if (present == false) {
        return std::nullopt;
    }
    return std::string(*session);
}

}  // namespace mcplink
