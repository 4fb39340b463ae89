// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "mcplink/log/logger.hpp"
#include "mcplink/log/spdlog_logger.hpp"

#include <spdlog/sinks/ostream_sink.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>

using namespace mcplink;

namespace {

std::filesystem::path temp_log(const std::string& name) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove(path);
    return path;
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Levels
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SpdlogLogger maps levels both ways", "[log][spdlog]") {
    REQUIRE(SpdlogLogger::to_spdlog_level(LogLevel::Error) == spdlog::level::err);
    REQUIRE(SpdlogLogger::to_spdlog_level(LogLevel::Fatal) == spdlog::level::critical);
    REQUIRE(SpdlogLogger::from_spdlog_level(spdlog::level::warn) == LogLevel::Warn);
    REQUIRE(SpdlogLogger::from_spdlog_level(spdlog::level::off) == LogLevel::Off);
}

TEST_CASE("SpdlogLogger honours the minimum level", "[log][spdlog]") {
    auto logger = make_spdlog_console_logger(LogLevel::Warn);

    REQUIRE_FALSE(logger->should_log(LogLevel::Info));
    REQUIRE(logger->should_log(LogLevel::Warn));
    REQUIRE(logger->should_log(LogLevel::Fatal));

    logger->set_level(LogLevel::Debug);
    REQUIRE(logger->should_log(LogLevel::Debug));
    REQUIRE_FALSE(logger->should_log(LogLevel::Trace));

    logger->set_level(LogLevel::Off);
    REQUIRE_FALSE(logger->should_log(LogLevel::Fatal));
}

// ═══════════════════════════════════════════════════════════════════════════
// Sinks
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SpdlogLogger wraps an existing spdlog logger", "[log][spdlog]") {
    std::ostringstream out;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    auto inner = std::make_shared<spdlog::logger>("wrapped", sink);
    inner->set_level(spdlog::level::debug);
    inner->set_pattern("%l|%v");

    SpdlogLogger logger(inner);
    REQUIRE(logger.should_log(LogLevel::Debug));

    logger.debug_fmt("[{}] Notification {}", "docs", "notifications/progress");
    logger.trace("hidden");
    logger.flush();

    REQUIRE(out.str() == "debug|[docs] Notification notifications/progress\n");
    REQUIRE(logger.get_spdlog_logger() == inner);
}

TEST_CASE("SpdlogLogger rejects a null logger", "[log][spdlog]") {
    REQUIRE_THROWS_AS(SpdlogLogger(std::shared_ptr<spdlog::logger>{}), std::invalid_argument);
}

TEST_CASE("make_logger writes to a file", "[log][spdlog][file]") {
    const auto path = temp_log("mcplink_logger_file.log");

    {
        LogConfig config;
        config.level = LogLevel::Info;
        config.console = false;
        config.file = path.string();
        config.pattern = "[%l] %v";

        auto logger = make_logger(config);
        logger->debug("not written");
        logger->info("[docs] Connected");
        logger->warn("[docs] Reconnect attempt 1 in 500ms");
        logger->flush();
    }

    const auto content = read_file(path);
    REQUIRE(content.find("[info] [docs] Connected") != std::string::npos);
    REQUIRE(content.find("[warning] [docs] Reconnect attempt 1 in 500ms") != std::string::npos);
    REQUIRE(content.find("not written") == std::string::npos);

    std::filesystem::remove(path);
}

TEST_CASE("make_spdlog_file_logger uses the default pattern", "[log][spdlog][file]") {
    const auto path = temp_log("mcplink_logger_default.log");

    {
        auto logger = make_spdlog_file_logger(path.string(), LogLevel::Info);
        logger->error("located line");
        logger->flush();
    }

    const auto content = read_file(path);
    REQUIRE(content.find("located line") != std::string::npos);
    REQUIRE(content.find("spdlog_logger_test") != std::string::npos);

    std::filesystem::remove(path);
}

TEST_CASE("make_logger without sinks drops messages", "[log][spdlog]") {
    LogConfig config;
    config.console = false;

    auto logger = make_logger(config);

    REQUIRE(logger->get_spdlog_logger()->sinks().empty());
    logger->info("nowhere");
}

TEST_CASE("SpdlogLogger serves as the global logger", "[log][spdlog]") {
    const auto path = temp_log("mcplink_logger_global.log");

    {
        auto logger = make_spdlog_file_logger(path.string(), LogLevel::Info);
        auto* raw = logger.get();
        set_logger(std::move(logger));

        MCPLINK_LOG_INFO("global logger line");
        raw->flush();
        set_logger(nullptr);
    }

    REQUIRE(read_file(path).find("global logger line") != std::string::npos);
    std::filesystem::remove(path);
}
