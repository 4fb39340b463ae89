// ─────────────────────────────────────────────────────────────────────────────
// mcplink-cli - connect to a remote MCP server
// ─────────────────────────────────────────────────────────────────────────────
// Usage:
//   mcplink-cli --url https://mcp.example.com/mcp --token secret --list-tools
//   mcplink-cli --url http://localhost:8080/sse --call search --args '{"q":"asio"}'
//   mcplink-cli --config server.json --watch
//
// Without a command the server info is printed. --watch stays connected,
// printing inbound messages, status changes and reconnects until SIGINT.

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include "mcplink/client/connection_config.hpp"
#include "mcplink/client/mcp_connection.hpp"
#include "mcplink/log/logger.hpp"
#include "mcplink/log/spdlog_logger.hpp"

#include <asio/co_spawn.hpp>
#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace mcplink;
using Json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// Output
// ═══════════════════════════════════════════════════════════════════════════

namespace color {
    const char* reset   = "\033[0m";
    const char* bold    = "\033[1m";
    const char* dim     = "\033[2m";
    const char* red     = "\033[31m";
    const char* green   = "\033[32m";
    const char* yellow  = "\033[33m";
    const char* cyan    = "\033[36m";

    bool enabled = true;

    std::string c(const char* code) {
        return enabled ? code : "";
    }
}

namespace {

void print_error(const std::string& msg) {
    std::cerr << color::c(color::red) << "Error: " << color::c(color::reset) << msg << "\n";
}

void print_header(const std::string& title) {
    std::cout << "\n" << color::c(color::bold) << color::c(color::cyan)
              << "═══ " << title << " ═══" << color::c(color::reset) << "\n\n";
}

void print_json(const Json& j) {
    std::cout << j.dump(2) << "\n";
}

std::string describe(const ClientError& error) {
    std::string text = error.message;
    if (error.rpc_error.has_value()) {
        text += " (code " + std::to_string(error.rpc_error->code) + ")";
    }
    return text;
}

/// "Name: Value" → pair; a missing colon yields an empty value.
std::pair<std::string, std::string> parse_header(const std::string& header) {
    const auto colon = header.find(':');
    if (colon == std::string::npos) {
        return {header, ""};
    }
    std::string value = header.substr(colon + 1);
    const auto start = value.find_first_not_of(" \t");
    value = (start == std::string::npos) ? std::string{} : value.substr(start);
    return {header.substr(0, colon), value};
}

std::string get_env(const char* name) {
    const char* value = std::getenv(name);
    return value ? value : "";
}

// ═══════════════════════════════════════════════════════════════════════════
// Commands
// ═══════════════════════════════════════════════════════════════════════════

struct Command {
    enum class Kind { Info, ListTools, CallTool, Watch };

    Kind kind{Kind::Info};
    std::string tool;
    Json arguments = Json::object();
    bool json_output{false};
};

void print_info(const InitializeResult& init, const McpConnection& connection, bool json_output) {
    const auto session = connection.session_id();
    if (json_output) {
        print_json({
            {"server", init.server_info.to_json()},
            {"protocolVersion", init.protocol_version},
            {"transport", std::string(to_string(connection.transport_kind()))},
            {"sessionId", session.has_value() ? Json(*session) : Json(nullptr)},
            {"capabilities", init.capabilities}
        });
        return;
    }

    print_header("Server Info");
    std::cout << color::c(color::bold) << "Name:      " << color::c(color::reset) << init.server_info.name << "\n";
    std::cout << color::c(color::bold) << "Version:   " << color::c(color::reset) << init.server_info.version << "\n";
    std::cout << color::c(color::bold) << "Protocol:  " << color::c(color::reset) << init.protocol_version << "\n";
    std::cout << color::c(color::bold) << "Transport: " << color::c(color::reset) << to_string(connection.transport_kind()) << "\n";
    std::cout << color::c(color::bold) << "Session:   " << color::c(color::reset) << session.value_or("(none)") << "\n";
    if (init.instructions.has_value()) {
        std::cout << "\n" << color::c(color::bold) << "Instructions:" << color::c(color::reset) << "\n"
                  << *init.instructions << "\n";
    }
}

asio::awaitable<int> list_tools(McpConnection& connection, bool json_output) {
    auto tools = co_await connection.list_tools();
    if (!tools) {
        print_error(describe(tools.error()));
        co_return 1;
    }

    if (json_output) {
        Json output = Json::array();
        for (const auto& tool : *tools) {
            output.push_back(tool.to_json());
        }
        print_json(output);
        co_return 0;
    }

    print_header("Tools");
    if (tools->empty()) {
        std::cout << color::c(color::dim) << "(no tools available)" << color::c(color::reset) << "\n";
    }
    for (const auto& tool : *tools) {
        std::cout << color::c(color::bold) << color::c(color::yellow) << "• " << tool.name << color::c(color::reset);
        if (tool.description.has_value()) {
            std::cout << "\n  " << color::c(color::dim) << *tool.description << color::c(color::reset);
        }
        std::cout << "\n";
    }
    co_return 0;
}

asio::awaitable<int> call_tool(McpConnection& connection, const Command& command) {
    auto result = co_await connection.call_tool(command.tool, command.arguments);
    if (!result) {
        print_error(describe(result.error()));
        co_return 1;
    }

    if (command.json_output) {
        Json output = {{"content", result->content}, {"isError", result->is_error}};
        if (result->structured_content.has_value()) {
            output["structuredContent"] = *result->structured_content;
        }
        print_json(output);
    } else {
        const auto text = result->text();
        if (text.empty()) {
            print_json(result->content);
        } else {
            std::cout << text << "\n";
        }
    }

    if (result->is_error) {
        print_error("Tool returned an error");
        co_return 1;
    }
    co_return 0;
}

asio::awaitable<int> watch(McpConnection& connection) {
    connection.on_message([](const Json& message) {
        std::cout << color::c(color::dim) << "← " << color::c(color::reset) << message.dump() << "\n";
    });
    connection.on_status_change([](const ServerStatus& status) {
        std::cout << color::c(color::cyan) << "status: " << to_string(status.state) << color::c(color::reset);
        if (status.error.has_value()) {
            std::cout << " (" << *status.error << ")";
        }
        std::cout << "\n";
    });
    connection.on_reconnect_scheduled([](std::size_t attempt, std::chrono::milliseconds delay) {
        std::cout << color::c(color::yellow) << "reconnect attempt " << attempt
                  << " in " << delay.count() << "ms" << color::c(color::reset) << "\n";
    });

    std::cout << color::c(color::dim) << "Watching; press Ctrl-C to stop" << color::c(color::reset) << "\n";

    asio::signal_set signals(co_await asio::this_coro::executor, SIGINT, SIGTERM);
    co_await signals.async_wait(asio::use_awaitable);
    co_return 0;
}

asio::awaitable<int> run(std::shared_ptr<McpConnection> connection, Command command) {
    auto init = co_await connection->connect();
    if (!init) {
        print_error("Failed to connect: " + describe(init.error()));
        co_await connection->disconnect();
        co_return 1;
    }

    int exit_code = 0;
    switch (command.kind) {
        case Command::Kind::Info:
            print_info(*init, *connection, command.json_output);
            break;
        case Command::Kind::ListTools:
            exit_code = co_await list_tools(*connection, command.json_output);
            break;
        case Command::Kind::CallTool:
            exit_code = co_await call_tool(*connection, command);
            break;
        case Command::Kind::Watch:
            exit_code = co_await watch(*connection);
            break;
    }

    co_await connection->disconnect();
    co_return exit_code;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("mcplink-cli", "Connect to a remote MCP server");

    options.add_options()
        // Server
        ("u,url", "MCP server URL", cxxopts::value<std::string>())
        ("t,token", "Bearer token (or MCPLINK_TOKEN env var)", cxxopts::value<std::string>())
        ("server-id", "Name used in log lines", cxxopts::value<std::string>())
        ("c,config", "JSON connection config file", cxxopts::value<std::string>())
        ("H,header", "HTTP header, 'Name: Value' (repeatable)", cxxopts::value<std::vector<std::string>>())
        ("timeout", "Request timeout in milliseconds", cxxopts::value<long>())

        // Commands
        ("list-tools", "List available tools")
        ("call", "Call a tool by name", cxxopts::value<std::string>())
        ("args", "JSON arguments for --call", cxxopts::value<std::string>()->default_value("{}"))
        ("w,watch", "Stay connected and print traffic until interrupted")

        // Output
        ("j,json", "Output results as JSON")
        ("no-color", "Disable colored output")
        ("log-file", "Also write logs to this file", cxxopts::value<std::string>())
        ("v,verbose", "Enable debug logging")
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            return 0;
        }

        color::enabled = !result.count("no-color");

        // Logging
        LogConfig log_config;
        log_config.level = result.count("verbose") ? LogLevel::Debug : LogLevel::Warn;
        if (result.count("log-file")) {
            log_config.file = result["log-file"].as<std::string>();
        }
        set_logger(make_logger(log_config));

        // Connection settings: file first, then flags
        ConnectionConfig config;
        if (result.count("config")) {
            auto loaded = load_connection_config_file(result["config"].as<std::string>());
            if (!loaded) {
                print_error(loaded.error().message);
                return 1;
            }
            config = std::move(*loaded);
        } else {
            config.server_id = "cli";
        }

        if (result.count("url")) {
            config.url = result["url"].as<std::string>();
        }
        if (result.count("server-id")) {
            config.server_id = result["server-id"].as<std::string>();
        }

        const std::string token = result.count("token")
            ? result["token"].as<std::string>()
            : get_env("MCPLINK_TOKEN");
        if (token.empty() == false) {
            config.with_bearer_token(token);
        }

        if (result.count("header")) {
            for (const auto& header : result["header"].as<std::vector<std::string>>()) {
                auto [name, value] = parse_header(header);
                config.with_header(name, std::move(value));
            }
        }
        if (result.count("timeout")) {
            config.with_request_timeout(std::chrono::milliseconds{result["timeout"].as<long>()});
        }

        if (config.url.empty()) {
            print_error("Must specify --url or --config");
            std::cout << "\n" << options.help() << "\n";
            return 1;
        }

        auto valid = config.validate();
        if (!valid) {
            print_error(valid.error().message);
            return 1;
        }

        Command command;
        command.json_output = result.count("json") > 0;
        if (result.count("watch")) {
            command.kind = Command::Kind::Watch;
        } else if (result.count("call")) {
            command.kind = Command::Kind::CallTool;
            command.tool = result["call"].as<std::string>();
            try {
                command.arguments = Json::parse(result["args"].as<std::string>());
            } catch (const Json::parse_error& e) {
                print_error("Invalid JSON arguments: " + std::string(e.what()));
                return 1;
            }
        } else if (result.count("list-tools")) {
            command.kind = Command::Kind::ListTools;
        }

        asio::io_context io;
        auto connection = McpConnection::create(io.get_executor(), std::move(config));

        int exit_code = 1;
        asio::co_spawn(io, run(connection, std::move(command)),
            [&](std::exception_ptr error, int code) {
                if (error) {
                    try {
                        std::rethrow_exception(error);
                    } catch (const std::exception& e) {
                        print_error(e.what());
                    }
                } else {
                    exit_code = code;
                }
                io.stop();
            });
        io.run();

        return exit_code;

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    }
}
