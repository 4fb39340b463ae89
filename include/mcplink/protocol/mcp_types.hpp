#ifndef MCPLINK_PROTOCOL_MCP_TYPES_HPP
#define MCPLINK_PROTOCOL_MCP_TYPES_HPP

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace mcplink {

using Json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// Protocol Versions
// ═══════════════════════════════════════════════════════════════════════════
// Streamable HTTP servers are probed with the current revision; servers that
// only speak the HTTP+SSE transport get the revision that defined it.

inline constexpr const char* kProtocolVersion = "2025-06-18";
inline constexpr const char* kLegacyProtocolVersion = "2024-11-05";

namespace method {
    inline constexpr const char* Initialize = "initialize";
    inline constexpr const char* Initialized = "notifications/initialized";
    inline constexpr const char* Ping = "ping";
    inline constexpr const char* ListTools = "tools/list";
    inline constexpr const char* CallTool = "tools/call";
}  // namespace method

// Field readers for server-supplied objects. A missing or mistyped field
// yields the fallback instead of throwing.
namespace detail {

inline std::string string_field(const Json& j, const char* key) {
    const bool present = j.is_object() && j.contains(key) && j[key].is_string();
    return present ? j[key].get<std::string>() : std::string{};
}

inline bool bool_field(const Json& j, const char* key, bool fallback) {
    const bool present = j.is_object() && j.contains(key) && j[key].is_boolean();
    return present ? j[key].get<bool>() : fallback;
}

}  // namespace detail

// ═══════════════════════════════════════════════════════════════════════════
// Client/Server Info
// ═══════════════════════════════════════════════════════════════════════════

struct Implementation {
    std::string name;
    std::string version;

    [[nodiscard]] Json to_json() const {
        return {{"name", name}, {"version", version}};
    }

    static Implementation from_json(const Json& j) {
        return {
            detail::string_field(j, "name"),
            detail::string_field(j, "version")
        };
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Initialize
// ═══════════════════════════════════════════════════════════════════════════

struct InitializeParams {
    std::string protocol_version = kProtocolVersion;
    Json capabilities = Json{{"roots", {{"listChanged", true}}}};
    Implementation client_info;

    [[nodiscard]] Json to_json() const {
        return {
            {"protocolVersion", protocol_version},
            {"capabilities", capabilities},
            {"clientInfo", client_info.to_json()}
        };
    }

    /// Parameters for a server reached over the HTTP+SSE transport.
    static InitializeParams legacy(Implementation client) {
        InitializeParams params;
        params.protocol_version = kLegacyProtocolVersion;
        params.capabilities = Json{
            {"experimental", Json::object()},
            {"roots", {{"listChanged", true}}}
        };
        params.client_info = std::move(client);
        return params;
    }
};

struct InitializeResult {
    std::string protocol_version;
    Json capabilities = Json::object();
    Implementation server_info;
    std::optional<std::string> instructions;

    static InitializeResult from_json(const Json& j) {
        InitializeResult result;
        if (j.is_object() == false) {
            return result;
        }
        result.protocol_version = detail::string_field(j, "protocolVersion");
        if (j.contains("capabilities") && j["capabilities"].is_object()) {
            result.capabilities = j["capabilities"];
        }
        if (j.contains("serverInfo") && j["serverInfo"].is_object()) {
            result.server_info = Implementation::from_json(j["serverInfo"]);
        }
        if (j.contains("instructions") && j["instructions"].is_string()) {
            result.instructions = j["instructions"].get<std::string>();
        }
        return result;
    }

    [[nodiscard]] bool supports_tools() const {
        return capabilities.contains("tools");
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Tools
// ═══════════════════════════════════════════════════════════════════════════

struct Tool {
    std::string name;
    std::optional<std::string> description;
    Json input_schema = Json::object();  // JSON Schema for tool arguments

    static Tool from_json(const Json& j) {
        Tool tool;
        if (j.is_object() == false) {
            return tool;
        }
        tool.name = detail::string_field(j, "name");
        if (j.contains("description") && j["description"].is_string()) {
            tool.description = j["description"].get<std::string>();
        }
        if (j.contains("inputSchema") && j["inputSchema"].is_object()) {
            tool.input_schema = j["inputSchema"];
        }
        return tool;
    }

    [[nodiscard]] Json to_json() const {
        Json j = {{"name", name}, {"inputSchema", input_schema}};
        if (description) {
            j["description"] = *description;
        }
        return j;
    }
};

struct ListToolsResult {
    std::vector<Tool> tools;
    std::optional<std::string> next_cursor;

    static ListToolsResult from_json(const Json& j) {
        ListToolsResult result;
        if (j.is_object() == false) {
            return result;
        }
        if (j.contains("tools") && j["tools"].is_array()) {
            for (const auto& t : j["tools"]) {
                auto tool = Tool::from_json(t);
                if (tool.name.empty()) {
                    continue;  // nameless entries cannot be called
                }
                result.tools.push_back(std::move(tool));
            }
        }
        if (j.contains("nextCursor") && j["nextCursor"].is_string()) {
            result.next_cursor = j["nextCursor"].get<std::string>();
        }
        return result;
    }
};

struct CallToolParams {
    std::string name;
    Json arguments = Json::object();

    [[nodiscard]] Json to_json() const {
        return {{"name", name}, {"arguments", arguments}};
    }
};

struct CallToolResult {
    Json content = Json::array();   // Content blocks exactly as the server sent them
    bool is_error = false;
    std::optional<Json> structured_content;

    static CallToolResult from_json(const Json& j) {
        CallToolResult result;
        if (j.is_object() == false) {
            return result;
        }
        result.is_error = detail::bool_field(j, "isError", false);
        if (j.contains("content") && j["content"].is_array()) {
            result.content = j["content"];
        }
        if (j.contains("structuredContent")) {
            result.structured_content = j["structuredContent"];
        }
        return result;
    }

    /// Concatenated text of all "text" content blocks, newline separated.
    [[nodiscard]] std::string text() const {
        std::string joined;
        for (const auto& block : content) {
            const bool is_text = detail::string_field(block, "type") == "text";
            if (is_text == false) {
                continue;
            }
            if (joined.empty() == false) {
                joined += '\n';
            }
            joined += detail::string_field(block, "text");
        }
        return joined;
    }
};

}  // namespace mcplink

#endif  // MCPLINK_PROTOCOL_MCP_TYPES_HPP
