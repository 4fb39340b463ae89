#include "mcplink/json/fast_json.hpp"

namespace mcplink {

namespace {

JsonParseError simdjson_failure(simdjson::error_code code) {
    return JsonParseError(std::string(simdjson::error_message(code)));
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// FastJsonParser
// ─────────────────────────────────────────────────────────────────────────────

ParsedJson FastJsonParser::parse(std::string_view text) {
    const simdjson::padded_string padded(text);

    auto iterated = parser_.iterate(padded);
    if (iterated.error() != simdjson::SUCCESS) {
        return tl::unexpected(simdjson_failure(iterated.error()));
    }

    try {
        auto document = std::move(iterated).value();
        auto value = document.get_value();
        if (value.error() != simdjson::SUCCESS) {
            return tl::unexpected(simdjson_failure(value.error()));
        }
        auto converted = convert(value.value(), 0);
        if (!converted) {
            return converted;
        }

        // On-demand parsing stops at the end of the first value; reject trailing content.
        const bool fully_consumed = document.at_end();
        if (fully_consumed == false) {
            return tl::unexpected(JsonParseError("Trailing content after JSON document"));
        }
        return converted;
    } catch (const simdjson::simdjson_error& e) {
        return tl::unexpected(JsonParseError(e.what()));
    }
}

ParsedJson FastJsonParser::convert(simdjson::ondemand::value value, std::size_t depth) {
    if (depth > config_.max_depth) {
        return tl::unexpected(JsonParseError(
            "Maximum nesting depth exceeded (" + std::to_string(config_.max_depth) + ")"));
    }

    auto type = value.type();
    if (type.error() != simdjson::SUCCESS) {
        return tl::unexpected(simdjson_failure(type.error()));
    }

    switch (type.value()) {
        case simdjson::ondemand::json_type::object: {
            auto object = value.get_object();
            if (object.error() != simdjson::SUCCESS) {
                return tl::unexpected(simdjson_failure(object.error()));
            }
            return convert_object(object.value(), depth + 1);
        }
        case simdjson::ondemand::json_type::array: {
            auto array = value.get_array();
            if (array.error() != simdjson::SUCCESS) {
                return tl::unexpected(simdjson_failure(array.error()));
            }
            return convert_array(array.value(), depth + 1);
        }
        default:
            return convert_scalar(value, type.value());
    }
}

ParsedJson FastJsonParser::convert_scalar(simdjson::ondemand::value value,
                                          simdjson::ondemand::json_type type) {
    switch (type) {
        case simdjson::ondemand::json_type::string: {
            auto text = value.get_string();
            if (text.error() != simdjson::SUCCESS) {
                return tl::unexpected(simdjson_failure(text.error()));
            }
            return nlohmann::json(std::string(text.value()));
        }
        case simdjson::ondemand::json_type::number: {
            // Request ids are unsigned 64-bit; try the integer forms before double.
            auto as_int = value.get_int64();
            if (as_int.error() == simdjson::SUCCESS) {
                return nlohmann::json(as_int.value());
            }
            auto as_uint = value.get_uint64();
            if (as_uint.error() == simdjson::SUCCESS) {
                return nlohmann::json(as_uint.value());
            }
            auto as_double = value.get_double();
            if (as_double.error() == simdjson::SUCCESS) {
                return nlohmann::json(as_double.value());
            }
            return tl::unexpected(simdjson_failure(as_double.error()));
        }
        case simdjson::ondemand::json_type::boolean: {
            auto flag = value.get_bool();
            if (flag.error() != simdjson::SUCCESS) {
                return tl::unexpected(simdjson_failure(flag.error()));
            }
            return nlohmann::json(flag.value());
        }
        case simdjson::ondemand::json_type::null:
            return nlohmann::json(nullptr);
        default:
            break;
    }
    return tl::unexpected(JsonParseError("Unsupported JSON value type"));
}

ParsedJson FastJsonParser::convert_object(simdjson::ondemand::object object, std::size_t depth) {
    nlohmann::json result = nlohmann::json::object();

    for (auto field : object) {
        auto key = field.unescaped_key();
        if (key.error() != simdjson::SUCCESS) {
            return tl::unexpected(simdjson_failure(key.error()));
        }
        // unescaped_key() points into the parser's string buffer; copy before the next field.
        std::string name(key.value());

        auto member = field.value();
        if (member.error() != simdjson::SUCCESS) {
            return tl::unexpected(simdjson_failure(member.error()));
        }
        auto converted = convert(member.value(), depth);
        if (!converted) {
            return converted;
        }
        result[std::move(name)] = std::move(*converted);
    }

    return result;
}

ParsedJson FastJsonParser::convert_array(simdjson::ondemand::array array, std::size_t depth) {
    nlohmann::json result = nlohmann::json::array();

    for (auto element : array) {
        if (element.error() != simdjson::SUCCESS) {
            return tl::unexpected(simdjson_failure(element.error()));
        }
        auto converted = convert(element.value(), depth);
        if (!converted) {
            return converted;
        }
        result.push_back(std::move(*converted));
    }

    return result;
}

// ─────────────────────────────────────────────────────────────────────────────
// Free Functions
// ─────────────────────────────────────────────────────────────────────────────

ParsedJson fast_parse(std::string_view text) {
    thread_local FastJsonParser parser;
    return parser.parse(text);
}

bool looks_like_json_document(std::string_view text) noexcept {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return false;
    }
    const char lead = text[first];
    return (lead == '{') || (lead == '[');
}

}  // namespace mcplink
