#pragma once

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace mcplink {

using Json = nlohmann::json;

inline constexpr std::string_view kJsonRpcVersion{"2.0"};

// Standard JSON-RPC error codes
namespace rpc_error_code {
    inline constexpr int ParseError = -32700;
    inline constexpr int InvalidRequest = -32600;
    inline constexpr int MethodNotFound = -32601;
    inline constexpr int InvalidParams = -32602;
    inline constexpr int InternalError = -32603;
}  // namespace rpc_error_code

struct JsonError {
    enum class Code {
        InvalidVersion,
        MissingField,
        InvalidId,
        InvalidParams,
        Internal
    };

    Code code{Code::Internal};
    std::string message;
};

template <typename T>
using JsonRpcResult = tl::expected<T, JsonError>;

// ─────────────────────────────────────────────────────────────────────────────
// Identifiers
// ─────────────────────────────────────────────────────────────────────────────

struct JsonRpcId {
    std::variant<std::int64_t, std::string> value;

    static JsonRpcId integer(std::int64_t v);
    static JsonRpcId string(std::string v);

    [[nodiscard]] Json to_json() const;
};

// ─────────────────────────────────────────────────────────────────────────────
// Outbound messages
// ─────────────────────────────────────────────────────────────────────────────

class JsonRpcRequest {
public:
    JsonRpcRequest(std::string method, std::int64_t id, std::optional<Json> params = std::nullopt);
    JsonRpcRequest(std::string method, JsonRpcId id, std::optional<Json> params = std::nullopt);

    [[nodiscard]] const std::string& method() const noexcept;
    [[nodiscard]] const JsonRpcId& id() const noexcept;
    [[nodiscard]] const std::optional<Json>& params() const noexcept;

    [[nodiscard]] Json to_json() const;

    /// Validate and decode a request received from the server.
    static JsonRpcResult<JsonRpcRequest> from_json(const Json& payload);

private:
    std::string method_;
    JsonRpcId id_;
    std::optional<Json> params_;
};

class JsonRpcNotification {
public:
    explicit JsonRpcNotification(std::string method, std::optional<Json> params = std::nullopt);

    [[nodiscard]] const std::string& method() const noexcept;
    [[nodiscard]] const std::optional<Json>& params() const noexcept;

    [[nodiscard]] Json to_json() const;

private:
    std::string method_;
    std::optional<Json> params_;
};

struct JsonRpcError {
    int code{rpc_error_code::InternalError};
    std::string message;
    std::optional<Json> data{};

    [[nodiscard]] Json to_json() const;

    /// Lenient decode of an "error" member; missing fields take defaults.
    static JsonRpcError from_json(const Json& node);
};

/// Builders for replies to server-initiated requests.
[[nodiscard]] Json make_result_response(const JsonRpcId& id, Json result);
[[nodiscard]] Json make_error_response(const JsonRpcId& id, const JsonRpcError& error);

// ─────────────────────────────────────────────────────────────────────────────
// Inbound classification
// ─────────────────────────────────────────────────────────────────────────────

enum class MessageKind {
    Request,        ///< method + id: the server expects a reply
    Notification,   ///< method, no id
    Response,       ///< id + exactly one of result/error
    Invalid
};

[[nodiscard]] constexpr std::string_view to_string(MessageKind kind) noexcept {
    switch (kind) {
        case MessageKind::Request:      return "request";
        case MessageKind::Notification: return "notification";
        case MessageKind::Response:     return "response";
        case MessageKind::Invalid:      return "invalid";
    }
    return "unknown";
}

[[nodiscard]] MessageKind classify_message(const Json& message) noexcept;

/// Id of a response as the client assigned it. Only non-negative integer ids
/// can match an outgoing request; anything else yields nullopt.
[[nodiscard]] std::optional<std::uint64_t> response_id(const Json& message) noexcept;

}  // namespace mcplink
