#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace mcplink {

/// One event decoded from a text/event-stream body.
///
///   event: <type>        (optional, "message" when absent)
///   id: <event-id>       (optional, echoed as Last-Event-ID on reconnect)
///   data: <payload>      (repeatable, joined with '\n')
///   retry: <ms>          (optional reconnection hint)
///   <blank line>         (dispatches the event)
///
struct SseEvent {
    std::optional<std::string> id;
    std::optional<std::string> event;
    std::string data;
    std::optional<std::uint32_t> retry;

    [[nodiscard]] bool is_type(std::string_view type) const noexcept {
        return event.has_value() && (*event == type);
    }
};

class SseBufferOverflowError : public std::runtime_error {
public:
    SseBufferOverflowError(std::size_t size, std::size_t limit)
        : std::runtime_error("SSE buffer overflow: " + std::to_string(size) +
                             " bytes exceeds limit of " + std::to_string(limit))
        , buffer_size(size)
        , buffer_limit(limit)
    {}

    std::size_t buffer_size;
    std::size_t buffer_limit;
};

struct SseParserConfig {
    /// Unconsumed bytes allowed before feed() throws SseBufferOverflowError
    std::size_t max_buffer_size{1024 * 1024};

    /// Events whose data exceeds this are dropped
    std::size_t max_event_size{512 * 1024};
};

/// Incremental event-stream parser.
///
/// Chunk boundaries are irrelevant: feeding a stream whole or split at any
/// byte offset produces the same events. Partial lines stay buffered until
/// their newline arrives; CRLF line endings are accepted.
///
///   SseParser parser;
///   while (auto chunk = read()) {
///       for (auto& event : parser.feed(*chunk)) handle(event);
///   }
///   for (auto& event : parser.finish()) handle(event);
///
class SseParser {
public:
    SseParser() = default;
    explicit SseParser(SseParserConfig config) : config_(config) {}

    /// Feed a chunk and collect the events it completes.
    /// Throws SseBufferOverflowError if the buffer would exceed max_buffer_size.
    [[nodiscard]] std::vector<SseEvent> feed(std::string_view chunk);

    /// End of stream. Processes a trailing line that never got its newline and
    /// dispatches a pending event that never got its blank line. A trailing
    /// line holding a bare JSON document is emitted as a data-only event, for
    /// servers that answer with an unterminated final frame.
    [[nodiscard]] std::vector<SseEvent> finish();

    void reset();

    [[nodiscard]] std::size_t buffered_bytes() const noexcept { return buffer_.size() - buffer_pos_; }

    /// Id of the most recent event that carried one.
    [[nodiscard]] const std::optional<std::string>& last_event_id() const noexcept { return last_event_id_; }

    [[nodiscard]] const SseParserConfig& config() const noexcept { return config_; }

private:
    SseParserConfig config_;
    std::string buffer_;
    std::size_t buffer_pos_{0};    // Start of the unconsumed region
    std::string current_data_;
    bool has_data_{false};         // "data:" with an empty value still counts
    std::optional<std::string> current_id_;
    std::optional<std::string> current_event_;
    std::optional<std::uint32_t> current_retry_;
    std::optional<std::string> last_event_id_;

    void maybe_compact_buffer();

    /// Returns true when the line was blank, i.e. the event is complete.
    bool process_line(std::string_view line);

    void dispatch_pending(std::vector<SseEvent>& out);
    void clear_pending();
};

}  // namespace mcplink
