/**
 * @file Log.hpp
 * @brief Logging service with runtime severity filtering.
 *
 * A Logger is an explicitly constructed object handed down by reference to
 * the subsystems that log (the Engine owns one, the hot-reload host borrows
 * one).  Output goes through an injectable ILogger sink; the default sink
 * writes to stderr.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef EMBER_CORE_LOG_HPP
    #define EMBER_CORE_LOG_HPP

    #include "NonCopyable.hpp"
    #include "Types.hpp"

    #include <format>
    #include <string_view>
    #include <utility>

namespace ember::core {

/**
 * @brief Severity levels for log messages.
 */
enum class LogLevel : u8 {
    kDebug = 0,
    kInfo,
    kWarn,
    kError,
    kFatal
};

/**
 * @brief Abstract sink for log messages.
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    /**
     * @brief Write a log entry.
     * @param level   Severity.
     * @param tag     Subsystem tag (e.g. "World", "HotReload").
     * @param message Formatted message body.
     */
    virtual void write(LogLevel level, std::string_view tag, std::string_view message) = 0;
};

/** @brief Process-wide stderr sink used when no sink is supplied. */
[[nodiscard]] ILogger &stderrLogger() noexcept;

/** @brief Returns the five-character label of a level ("INFO ", "WARN "...). */
[[nodiscard]] std::string_view levelName(LogLevel level) noexcept;

/**
 * @brief Logging service bound to one sink and one minimum level.
 *
 * Messages under the minimum level are dropped before formatting.
 */
class Logger final : public NonCopyable<Logger> {
public:
    explicit Logger(ILogger *sink = nullptr, LogLevel minLevel = LogLevel::kInfo) noexcept;

    void setSink(ILogger *sink) noexcept;
    void setMinLevel(LogLevel level) noexcept { _minLevel = level; }

    [[nodiscard]] LogLevel minLevel() const noexcept { return _minLevel; }
    [[nodiscard]] bool     enabled(LogLevel level) const noexcept { return level >= _minLevel; }

    void write(LogLevel level, std::string_view tag, std::string_view message);

    template <typename... Args>
    void debug(std::string_view tag, std::format_string<Args...> fmt, Args &&...args)
    {
        log(LogLevel::kDebug, tag, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(std::string_view tag, std::format_string<Args...> fmt, Args &&...args)
    {
        log(LogLevel::kInfo, tag, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(std::string_view tag, std::format_string<Args...> fmt, Args &&...args)
    {
        log(LogLevel::kWarn, tag, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(std::string_view tag, std::format_string<Args...> fmt, Args &&...args)
    {
        log(LogLevel::kError, tag, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void fatal(std::string_view tag, std::format_string<Args...> fmt, Args &&...args)
    {
        log(LogLevel::kFatal, tag, fmt, std::forward<Args>(args)...);
    }

private:
    template <typename... Args>
    void log(LogLevel level, std::string_view tag, std::format_string<Args...> fmt, Args &&...args)
    {
        if (!enabled(level))
            return;
        write(level, tag, std::format(fmt, std::forward<Args>(args)...));
    }

    ILogger  *_sink;
    LogLevel  _minLevel;
};

} // namespace ember::core

#endif // EMBER_CORE_LOG_HPP
