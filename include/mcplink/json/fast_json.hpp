#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// Fast JSON decoding
// ─────────────────────────────────────────────────────────────────────────────
//
// Inbound frames are decoded with simdjson's on-demand API and converted into
// nlohmann::json, which the rest of the library uses for inspection and for
// building outbound messages.
//
//   auto doc = mcplink::fast_parse(frame.data);
//   if (doc.has_value()) {
//       dispatch(*doc);
//   }
//
// ─────────────────────────────────────────────────────────────────────────────

#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <tl/expected.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace mcplink {

struct JsonParseError {
    std::string message;

    JsonParseError() = default;
    explicit JsonParseError(std::string msg) : message(std::move(msg)) {}
};

using ParsedJson = tl::expected<nlohmann::json, JsonParseError>;

struct FastJsonConfig {
    // Nesting limit; frames deeper than this are rejected rather than recursed into
    std::size_t max_depth{64};
};

class FastJsonParser {
public:
    FastJsonParser() = default;
    explicit FastJsonParser(FastJsonConfig config) : config_(config) {}

    /// Parse a complete document. Not thread-safe; use one parser per thread.
    [[nodiscard]] ParsedJson parse(std::string_view text);

    [[nodiscard]] const FastJsonConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] ParsedJson convert(simdjson::ondemand::value value, std::size_t depth);
    [[nodiscard]] ParsedJson convert_object(simdjson::ondemand::object object, std::size_t depth);
    [[nodiscard]] ParsedJson convert_array(simdjson::ondemand::array array, std::size_t depth);
    [[nodiscard]] static ParsedJson convert_scalar(simdjson::ondemand::value value,
                                                   simdjson::ondemand::json_type type);

    simdjson::ondemand::parser parser_;
    FastJsonConfig config_;
};

/// Parse with a thread-local parser.
[[nodiscard]] ParsedJson fast_parse(std::string_view text);

/// True when the text, ignoring surrounding whitespace, starts like a JSON
/// object or array. Used to skip non-JSON payload lines without parsing them.
[[nodiscard]] bool looks_like_json_document(std::string_view text) noexcept;

}  // namespace mcplink
