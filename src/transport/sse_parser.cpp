#include "mcplink/transport/sse_parser.hpp"

#include "mcplink/json/fast_json.hpp"

#include <charconv>

namespace mcplink {

// Consumed bytes are erased only past this mark, not on every line
constexpr std::size_t buffer_compact_threshold = 4096;

std::vector<SseEvent> SseParser::feed(std::string_view chunk) {
    std::vector<SseEvent> events;

    const std::size_t new_size = buffered_bytes() + chunk.size();
    if (new_size > config_.max_buffer_size) {
        throw SseBufferOverflowError(new_size, config_.max_buffer_size);
    }

    buffer_ += chunk;

    std::size_t newline_pos = 0;
    while ((newline_pos = buffer_.find('\n', buffer_pos_)) != std::string::npos) {
        std::string_view line(buffer_.data() + buffer_pos_, newline_pos - buffer_pos_);

        const bool has_carriage_return = (!line.empty()) && (line.back() == '\r');
        if (has_carriage_return) {
            line.remove_suffix(1);
        }

        buffer_pos_ = newline_pos + 1;

        const bool event_complete = process_line(line);
        if (event_complete) {
            dispatch_pending(events);
        }
    }

    maybe_compact_buffer();
    return events;
}

std::vector<SseEvent> SseParser::finish() {
    std::vector<SseEvent> events;

    std::string_view trailing(buffer_.data() + buffer_pos_, buffer_.size() - buffer_pos_);
    if (!trailing.empty() && trailing.back() == '\r') {
        trailing.remove_suffix(1);
    }

    const bool has_trailing_line = (trailing.empty() == false);
    if (has_trailing_line) {
        if (looks_like_json_document(trailing)) {
            // Not a field line at all: the server wrote a raw document and closed.
            dispatch_pending(events);
            SseEvent raw;
            raw.data = std::string(trailing);
            events.push_back(std::move(raw));
        } else {
            const bool event_complete = process_line(trailing);
            if (event_complete) {
                dispatch_pending(events);
            }
        }
    }

    dispatch_pending(events);

    buffer_.clear();
    buffer_pos_ = 0;
    return events;
}

void SseParser::maybe_compact_buffer() {
    if (buffer_pos_ > buffer_compact_threshold) {
        buffer_.erase(0, buffer_pos_);
        buffer_pos_ = 0;
    }
}

void SseParser::reset() {
    buffer_.clear();
    buffer_pos_ = 0;
    clear_pending();
    last_event_id_ = std::nullopt;
}

bool SseParser::process_line(std::string_view line) {
    if (line.empty()) {
        return true;
    }

    const bool is_comment = (line.front() == ':');
    if (is_comment) {
        return false;
    }

    std::string_view field_name;
    std::string_view field_value;

    const std::size_t colon_pos = line.find(':');
    const bool has_colon = (colon_pos != std::string_view::npos);

    if (has_colon == false) {
        field_name = line;
    } else {
        field_name = line.substr(0, colon_pos);
        std::size_t value_start = colon_pos + 1;
        const bool has_space_after_colon =
            (value_start < line.size()) && (line[value_start] == ' ');
        if (has_space_after_colon) {
            value_start += 1;
        }
        field_value = line.substr(value_start);
    }

    if (field_name == "event") {
        current_event_ = std::string(field_value);
    }
    else if (field_name == "data") {
        if (has_data_) {
            current_data_ += '\n';
        }
        current_data_ += field_value;
        has_data_ = true;
    }
    else if (field_name == "id") {
        // An id containing NUL is ignored per the event-stream grammar
        const bool has_null = (field_value.find('\0') != std::string_view::npos);
        if (has_null == false) {
            current_id_ = std::string(field_value);
        }
    }
    else if (field_name == "retry") {
        std::uint32_t retry_ms = 0;
        auto [ptr, ec] = std::from_chars(
            field_value.data(),
            field_value.data() + field_value.size(),
            retry_ms
        );
        if (ec == std::errc{} && ptr == field_value.data() + field_value.size()) {
            current_retry_ = retry_ms;
        }
    }

    return false;
}

void SseParser::dispatch_pending(std::vector<SseEvent>& out) {
    if (current_id_.has_value()) {
        last_event_id_ = current_id_;
    }

    // A blank line with no data only resets the event fields
    const bool has_payload = has_data_;
    const bool oversized = (current_data_.size() > config_.max_event_size);
    if (has_payload && (oversized == false)) {
        out.push_back(SseEvent{
            std::move(current_id_),
            std::move(current_event_),
            std::move(current_data_),
            current_retry_
        });
    } else if (current_retry_.has_value() && (has_payload == false)) {
        // Retry hints are meaningful on their own
        out.push_back(SseEvent{std::nullopt, std::nullopt, std::string{}, current_retry_});
    }

    clear_pending();
}

void SseParser::clear_pending() {
    current_data_.clear();
    has_data_ = false;
    current_id_ = std::nullopt;
    current_event_ = std::nullopt;
    current_retry_ = std::nullopt;
}

}  // namespace mcplink
