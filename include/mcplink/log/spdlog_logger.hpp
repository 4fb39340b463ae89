#pragma once

#include "mcplink/log/logger.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace mcplink {

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger - ILogger backed by spdlog
// ─────────────────────────────────────────────────────────────────────────────

inline constexpr const char* kDefaultLogPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v";

class SpdlogLogger final : public ILogger {
public:
    /// Wrap an existing spdlog logger. Throws std::invalid_argument on nullptr.
    explicit SpdlogLogger(std::shared_ptr<spdlog::logger> logger);

    /// Build a logger over the given sinks.
    SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LogLevel min_level);

    SpdlogLogger(const SpdlogLogger&) = delete;
    SpdlogLogger& operator=(const SpdlogLogger&) = delete;

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override;

    [[nodiscard]] std::shared_ptr<spdlog::logger> get_spdlog_logger() const noexcept {
        return logger_;
    }

    void set_level(LogLevel level) noexcept;
    void set_pattern(const std::string& pattern);
    void flush();

    [[nodiscard]] static spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept;

private:
    std::shared_ptr<spdlog::logger> logger_;
    LogLevel min_level_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Log Configuration
// ─────────────────────────────────────────────────────────────────────────────

struct LogConfig {
    LogLevel level{LogLevel::Info};
    bool console{true};
    std::optional<std::string> file;   // Append to this file when set
    std::string pattern{kDefaultLogPattern};
};

/// Build an spdlog-backed logger from configuration.
/// With neither console nor file enabled the logger has no sinks and drops everything.
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_logger(const LogConfig& config);

[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_console_logger(
    LogLevel min_level = LogLevel::Info
);

[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_file_logger(
    const std::string& filename,
    LogLevel min_level = LogLevel::Info
);

}  // namespace mcplink
