#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace docqa {

/// Process-wide spdlog logger. Writes to stderr so that stdout stays free
/// for command output.
class Logger {
public:
    static void init(std::string_view name = "docqa", std::string_view level = "info");
    static auto get() -> std::shared_ptr<spdlog::logger>&;

    /// Unknown names fall back to info.
    static void set_level(std::string_view level);
    static void flush();

    /// Maps a configured level name ("warning" is accepted for "warn").
    static auto parse_level(std::string_view level)
        -> std::optional<spdlog::level::level_enum>;
};

} // namespace docqa

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::docqa::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::docqa::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...)  SPDLOG_LOGGER_INFO(::docqa::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...)  SPDLOG_LOGGER_WARN(::docqa::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::docqa::Logger::get(), __VA_ARGS__)
#define LOG_FATAL(...) SPDLOG_LOGGER_CRITICAL(::docqa::Logger::get(), __VA_ARGS__)
