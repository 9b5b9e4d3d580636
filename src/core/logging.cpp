/**
 *  @file       logging.cpp
 *
 *  Implementation of the logging sink and level filter.
 */

#include "pipa/core/logging.hpp"

#include <atomic>
#include <cstdio>
#include <mutex>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace pipa::core
{

namespace
{

std::atomic<LogLevel> g_log_level{LogLevel::kWarning};

std::mutex g_sink_mutex;
LogSink g_sink;

/**
 *  Strips the directory part of a __FILE__ path.
 */
[[nodiscard]] auto baseName(const char* path) noexcept -> std::string_view
{
    std::string_view view{path != nullptr ? path : ""};
    auto slash = view.find_last_of('/');
    if (slash == std::string_view::npos)
    {
        return view;
    }
    return view.substr(slash + 1);
}

void writeToStderr(LogLevel level, const SourceLocation& location, std::string_view message)
{
    fmt::print(stderr, "[pipa] {} {}:{}: {}\n", toString(level), baseName(location.file),
               location.line, message);
}

}  // namespace

void setLogLevel(LogLevel level) noexcept
{
    g_log_level.store(level, std::memory_order_relaxed);
}

auto logLevel() noexcept -> LogLevel
{
    return g_log_level.load(std::memory_order_relaxed);
}

auto isLogEnabled(LogLevel level) noexcept -> bool
{
    auto minimum = g_log_level.load(std::memory_order_relaxed);
    return minimum != LogLevel::kOff && level >= minimum;
}

void setLogSink(LogSink sink)
{
    std::lock_guard lock(g_sink_mutex);
    g_sink = std::move(sink);
}

void logMessage(LogLevel level, const SourceLocation& location, std::string_view message)
{
    if (!isLogEnabled(level))
    {
        return;
    }

    // Call the sink outside the lock so that it may log itself
    LogSink sink;
    {
        std::lock_guard lock(g_sink_mutex);
        sink = g_sink;
    }

    if (sink)
    {
        sink(level, location, message);
        return;
    }
    writeToStderr(level, location, message);
}

}  // namespace pipa::core
