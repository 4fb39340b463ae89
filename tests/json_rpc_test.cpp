#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include "mcplink/protocol/json_rpc.hpp"

using json = nlohmann::json;
using namespace mcplink;

// ─────────────────────────────────────────────────────────────────────────────
// Outbound
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("JsonRpcRequest serializes ids and params", "[json-rpc][request]") {
    auto params = json::object({{"cursor", "page-2"}});
    JsonRpcRequest request{"tools/list", std::int64_t{42}, params};

    auto j = request.to_json();

    REQUIRE(j["jsonrpc"] == "2.0");
    REQUIRE(j["method"] == "tools/list");
    REQUIRE(j["id"] == 42);
    REQUIRE(j["params"] == params);
}

TEST_CASE("JsonRpcRequest omits absent params", "[json-rpc][request]") {
    JsonRpcRequest request{"ping", JsonRpcId::string("srv-1")};

    auto j = request.to_json();

    REQUIRE(j["id"] == "srv-1");
    REQUIRE(j.contains("params") == false);
}

TEST_CASE("JsonRpcNotification has no id", "[json-rpc][notification]") {
    JsonRpcNotification notification{"notifications/initialized"};

    auto j = notification.to_json();

    REQUIRE(j["jsonrpc"] == "2.0");
    REQUIRE(j["method"] == "notifications/initialized");
    REQUIRE(j.contains("id") == false);
    REQUIRE(classify_message(j) == MessageKind::Notification);
}

TEST_CASE("Reply builders echo the request id", "[json-rpc][response]") {
    const auto id = JsonRpcId::string("abc");

    auto ok = make_result_response(id, json::object());
    REQUIRE(ok["id"] == "abc");
    REQUIRE(ok["result"].is_object());
    REQUIRE(ok.contains("error") == false);

    auto failed = make_error_response(id, JsonRpcError{rpc_error_code::MethodNotFound, "Method not found: sampling/createMessage"});
    REQUIRE(failed["error"]["code"] == -32601);
    REQUIRE(failed["error"]["message"] == "Method not found: sampling/createMessage");
    REQUIRE(failed["error"].contains("data") == false);
}

// ─────────────────────────────────────────────────────────────────────────────
// Inbound requests
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("JsonRpcRequest decodes server requests", "[json-rpc][request]") {
    json payload = {
        {"jsonrpc", "2.0"},
        {"method", "ping"},
        {"id", "req-001"},
        {"params", json::object()}
    };

    auto parsed = JsonRpcRequest::from_json(payload);
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->method() == "ping");
    REQUIRE(std::get<std::string>(parsed->id().value) == "req-001");
    REQUIRE(parsed->params().has_value());
}

TEST_CASE("JsonRpcRequest rejects malformed payloads", "[json-rpc][request]") {
    SECTION("not an object") {
        auto parsed = JsonRpcRequest::from_json(json::array());
        REQUIRE_FALSE(parsed.has_value());
    }
    SECTION("wrong version") {
        auto parsed = JsonRpcRequest::from_json({{"jsonrpc", "1.0"}, {"method", "ping"}, {"id", 1}});
        REQUIRE_FALSE(parsed.has_value());
        REQUIRE(parsed.error().code == JsonError::Code::InvalidVersion);
    }
    SECTION("missing id") {
        auto parsed = JsonRpcRequest::from_json({{"jsonrpc", "2.0"}, {"method", "ping"}});
        REQUIRE_FALSE(parsed.has_value());
        REQUIRE(parsed.error().code == JsonError::Code::InvalidId);
    }
    SECTION("fractional id") {
        auto parsed = JsonRpcRequest::from_json({{"jsonrpc", "2.0"}, {"method", "ping"}, {"id", 1.5}});
        REQUIRE_FALSE(parsed.has_value());
    }
    SECTION("scalar params") {
        auto parsed = JsonRpcRequest::from_json({{"jsonrpc", "2.0"}, {"method", "ping"}, {"id", 1}, {"params", 3}});
        REQUIRE_FALSE(parsed.has_value());
        REQUIRE(parsed.error().code == JsonError::Code::InvalidParams);
    }
}

TEST_CASE("JsonRpcError tolerates loose error objects", "[json-rpc][error]") {
    auto full = JsonRpcError::from_json({{"code", -32602}, {"message", "bad"}, {"data", {{"field", "x"}}}});
    REQUIRE(full.code == -32602);
    REQUIRE(full.message == "bad");
    REQUIRE(full.data.has_value());

    auto bare = JsonRpcError::from_json("boom");
    REQUIRE(bare.message == "boom");
}

// ─────────────────────────────────────────────────────────────────────────────
// Classification
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("classify_message tells requests, notifications and responses apart", "[json-rpc][classify]") {
    REQUIRE(classify_message({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "ping"}}) == MessageKind::Request);
    REQUIRE(classify_message({{"jsonrpc", "2.0"}, {"method", "notifications/progress"}}) == MessageKind::Notification);
    REQUIRE(classify_message({{"jsonrpc", "2.0"}, {"id", 1}, {"result", json::object()}}) == MessageKind::Response);
    REQUIRE(classify_message({{"jsonrpc", "2.0"}, {"id", 1}, {"error", {{"code", -1}, {"message", "x"}}}}) == MessageKind::Response);

    SECTION("invalid shapes") {
        REQUIRE(classify_message(json::array()) == MessageKind::Invalid);
        REQUIRE(classify_message({{"id", 1}}) == MessageKind::Invalid);
        REQUIRE(classify_message({{"id", 1}, {"result", 1}, {"error", 2}}) == MessageKind::Invalid);
        REQUIRE(classify_message({{"id", nullptr}, {"result", 1}}) == MessageKind::Invalid);
    }
}

TEST_CASE("response_id only matches ids the client could have assigned", "[json-rpc][classify]") {
    REQUIRE(response_id({{"id", 7}, {"result", 1}}) == std::optional<std::uint64_t>{7});
    REQUIRE(response_id({{"id", std::uint64_t{18446744073709551615ULL}}, {"result", 1}}).value() == 18446744073709551615ULL);
    REQUIRE(response_id({{"id", -3}, {"result", 1}}).has_value() == false);
    REQUIRE(response_id({{"id", "7"}, {"result", 1}}).has_value() == false);
    REQUIRE(response_id({{"result", 1}}).has_value() == false);
    REQUIRE(response_id(json("text")).has_value() == false);
}
