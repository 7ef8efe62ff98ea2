/**
 * @file Log.cpp
 * @brief Default stderr sink and Logger dispatch.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "ember/core/Log.hpp"

#include <cstdio>

namespace ember::core {

namespace {

class StderrLogger final : public ILogger {
public:
    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        const std::string_view label = levelName(level);
        std::fprintf(
            stderr,
            "[%.*s][%.*s] %.*s\n",
            static_cast<int>(label.size()), label.data(),
            static_cast<int>(tag.size()), tag.data(),
            static_cast<int>(message.size()), message.data()
        );
    }
};

StderrLogger gStderrLogger;

} // anonymous namespace

ILogger &stderrLogger() noexcept { return gStderrLogger; }

std::string_view levelName(LogLevel level) noexcept
{
    static constexpr std::string_view kLevelNames[] = {
        "DEBUG", "INFO ", "WARN ", "ERROR", "FATAL"
    };
    const auto idx = static_cast<unsigned>(level);
    return idx < std::size(kLevelNames) ? kLevelNames[idx] : "?????";
}

Logger::Logger(ILogger *sink, LogLevel minLevel) noexcept
    : _sink(sink ? sink : &gStderrLogger), _minLevel(minLevel)
{
}

void Logger::setSink(ILogger *sink) noexcept { _sink = sink ? sink : &gStderrLogger; }

void Logger::write(LogLevel level, std::string_view tag, std::string_view message)
{
    if (!enabled(level))
        return;
    _sink->write(level, tag, message);
}

} // namespace ember::core
