#include "mcplink/protocol/json_rpc.hpp"

namespace mcplink {
namespace {

bool is_valid_params_type(const Json& node) {
    const bool is_object = node.is_object();
    const bool is_array = node.is_array();
    return (is_object == true) || (is_array == true);
}

JsonRpcResult<JsonRpcId> parse_id_field(const Json& id_node) {
    if (id_node.is_number_integer() == true) {
        return JsonRpcId::integer(id_node.get<std::int64_t>());
    }
    if (id_node.is_string() == true) {
        return JsonRpcId::string(id_node.get<std::string>());
    }

    return tl::unexpected(JsonError{
        JsonError::Code::InvalidId,
        "id must be an integer or string"});
}

bool has_version_marker(const Json& message) {
    const auto it = message.find("jsonrpc");
    if (it == message.end()) {
        return false;
    }
    return it->is_string() && (it->get<std::string>() == kJsonRpcVersion);
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcId
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcId JsonRpcId::integer(std::int64_t value) {
    return JsonRpcId{value};
}

JsonRpcId JsonRpcId::string(std::string value) {
    return JsonRpcId{std::move(value)};
}

Json JsonRpcId::to_json() const {
    return std::visit([](const auto& id_value) { return Json(id_value); }, value);
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcRequest
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcRequest::JsonRpcRequest(std::string method,
                               std::int64_t id,
                               std::optional<Json> params)
    : JsonRpcRequest(std::move(method), JsonRpcId::integer(id), std::move(params)) {}

JsonRpcRequest::JsonRpcRequest(std::string method,
                               JsonRpcId id,
                               std::optional<Json> params)
    : method_(std::move(method)),
      id_(std::move(id)),
      params_(std::move(params)) {}

const std::string& JsonRpcRequest::method() const noexcept {
    return method_;
}

const JsonRpcId& JsonRpcRequest::id() const noexcept {
    return id_;
}

const std::optional<Json>& JsonRpcRequest::params() const noexcept {
    return params_;
}

Json JsonRpcRequest::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["id"] = id_.to_json();
    payload["method"] = method_;
    if (params_.has_value()) {
        payload["params"] = *params_;
    }
    return payload;
}

JsonRpcResult<JsonRpcRequest> JsonRpcRequest::from_json(const Json& payload) {
    if (payload.is_object() == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidParams,
            "payload must be a JSON object"});
    }

    if (payload.contains("jsonrpc") == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::MissingField,
            "missing jsonrpc version field"});
    }
    if (has_version_marker(payload) == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidVersion,
            "jsonrpc must equal \"2.0\""});
    }

    const auto method_it = payload.find("method");
    if (method_it == payload.end()) {
        return tl::unexpected(JsonError{
            JsonError::Code::MissingField,
            "missing method field"});
    }
    if (method_it->is_string() == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidParams,
            "method must be a string"});
    }

    const auto id_it = payload.find("id");
    if (id_it == payload.end()) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidId,
            "missing id field"});
    }
    auto parsed_id = parse_id_field(*id_it);
    if (parsed_id.has_value() == false) {
        return tl::unexpected(parsed_id.error());
    }

    std::optional<Json> parsed_params;
    const auto params_it = payload.find("params");
    if (params_it != payload.end()) {
        if (is_valid_params_type(*params_it) == false) {
            return tl::unexpected(JsonError{
                JsonError::Code::InvalidParams,
                "params must be an object or array"});
        }
        parsed_params = *params_it;
    }

    return JsonRpcRequest(method_it->get<std::string>(), *parsed_id, parsed_params);
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcNotification
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcNotification::JsonRpcNotification(std::string method,
                                         std::optional<Json> params)
    : method_(std::move(method)),
      params_(std::move(params)) {}

const std::string& JsonRpcNotification::method() const noexcept {
    return method_;
}

const std::optional<Json>& JsonRpcNotification::params() const noexcept {
    return params_;
}

Json JsonRpcNotification::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["method"] = method_;
    if (params_.has_value()) {
        payload["params"] = *params_;
    }
    return payload;
}

// ─────────────────────────────────────────────────────────────────────────────
// Errors and replies
// ─────────────────────────────────────────────────────────────────────────────

Json JsonRpcError::to_json() const {
    Json payload = Json::object();
    payload["code"] = code;
    payload["message"] = message;
    if (data.has_value()) {
        payload["data"] = *data;
    }
    return payload;
}

JsonRpcError JsonRpcError::from_json(const Json& node) {
    JsonRpcError error;
    if (node.is_object() == false) {
        error.message = node.is_string() ? node.get<std::string>() : node.dump();
        return error;
    }
    const auto code_it = node.find("code");
    if (code_it != node.end() && code_it->is_number_integer()) {
        error.code = code_it->get<int>();
    }
    const auto message_it = node.find("message");
    if (message_it != node.end() && message_it->is_string()) {
        error.message = message_it->get<std::string>();
    }
    const auto data_it = node.find("data");
    if (data_it != node.end()) {
        error.data = *data_it;
    }
    return error;
}

Json make_result_response(const JsonRpcId& id, Json result) {
    return Json{
        {"jsonrpc", kJsonRpcVersion},
        {"id", id.to_json()},
        {"result", std::move(result)}
    };
}

Json make_error_response(const JsonRpcId& id, const JsonRpcError& error) {
    return Json{
        {"jsonrpc", kJsonRpcVersion},
        {"id", id.to_json()},
        {"error", error.to_json()}
    };
}

// ─────────────────────────────────────────────────────────────────────────────
// Classification
// ─────────────────────────────────────────────────────────────────────────────

MessageKind classify_message(const Json& message) noexcept {
    if (message.is_object() == false) {
        return MessageKind::Invalid;
    }

    const auto method_it = message.find("method");
    const bool has_method = (method_it != message.end()) && method_it->is_string();
    const auto id_it = message.find("id");
    const bool has_id = (id_it != message.end()) && (id_it->is_null() == false);

    if (has_method) {
        return has_id ? MessageKind::Request : MessageKind::Notification;
    }

    const bool has_result = message.contains("result");
    const bool has_error = message.contains("error");
    // Result and error are mutually exclusive on a well-formed response
    if (has_id && (has_result != has_error)) {
        return MessageKind::Response;
    }
    return MessageKind::Invalid;
}

std::optional<std::uint64_t> response_id(const Json& message) noexcept {
    if (message.is_object() == false) {
        return std::nullopt;
    }
    const auto id_it = message.find("id");
    if (id_it == message.end()) {
        return std::nullopt;
    }
    if (id_it->is_number_unsigned()) {
        return id_it->get<std::uint64_t>();
    }
    if (id_it->is_number_integer()) {
        const auto signed_id = id_it->get<std::int64_t>();
        if (signed_id >= 0) {
            return static_cast<std::uint64_t>(signed_id);
        }
    }
    return std::nullopt;
}

}  // namespace mcplink
