/**
 *  @file       logging.hpp
 *
 *  Diagnostic logging for the PIPA collector.
 *
 *  Log items carry a level and the source location of the call site and
 *  are formatted with {fmt}. Items below the global minimum level are
 *  discarded before formatting. Output goes to a replaceable sink so that
 *  embedding applications and tests can capture it.
 */

#ifndef PIPA_CORE_LOGGING_HPP_
#define PIPA_CORE_LOGGING_HPP_

#include <cstdint>
#include <functional>
#include <string_view>
#include <utility>

#include <fmt/format.h>

/** Log an item at the given level */
#define PIPA_LOG_ITEM(level, ...)                                                                  \
    ::pipa::core::detail::logFormatted((level), ::pipa::core::SourceLocation{__FILE__, __LINE__},  \
                                       __VA_ARGS__)

/** Log a 'trace' level item */
#define PIPA_LOG_TRACE(...) PIPA_LOG_ITEM(::pipa::core::LogLevel::kTrace, __VA_ARGS__)

/** Log a 'debug' level item */
#define PIPA_LOG_DEBUG(...) PIPA_LOG_ITEM(::pipa::core::LogLevel::kDebug, __VA_ARGS__)

/** Log an 'info' level item */
#define PIPA_LOG_INFO(...) PIPA_LOG_ITEM(::pipa::core::LogLevel::kInfo, __VA_ARGS__)

/** Log a 'warning' level item */
#define PIPA_LOG_WARNING(...) PIPA_LOG_ITEM(::pipa::core::LogLevel::kWarning, __VA_ARGS__)

/** Log an 'error' level item */
#define PIPA_LOG_ERROR(...) PIPA_LOG_ITEM(::pipa::core::LogLevel::kError, __VA_ARGS__)

namespace pipa::core
{

/**
 *  Severity of a log item, in increasing order.
 */
enum class LogLevel : std::uint8_t
{
    kTrace = 0,
    kDebug = 1,
    kInfo = 2,
    kWarning = 3,
    kError = 4,
    kOff = 5,
};

/**
 *  Converts a LogLevel to the tag printed by the default sink.
 *
 *  @param      level  The level to convert.
 *  @return     A short upper-case tag.
 */
[[nodiscard]] constexpr auto toString(LogLevel level) noexcept -> std::string_view
{
    switch (level)
    {
        case LogLevel::kTrace:
            return "TRACE";
        case LogLevel::kDebug:
            return "DEBUG";
        case LogLevel::kInfo:
            return "INFO";
        case LogLevel::kWarning:
            return "WARNING";
        case LogLevel::kError:
            return "ERROR";
        case LogLevel::kOff:
            return "OFF";
    }
    return "UNKNOWN";
}

/**
 *  File and line of the statement that produced a log item.
 */
struct SourceLocation
{
    const char* file;
    int line;
};

/**
 *  Receives every log item that passes the level filter.
 *
 *  Sinks may be invoked concurrently from the collection thread and the
 *  caller's thread and must be thread-safe.
 */
using LogSink = std::function<void(LogLevel, const SourceLocation&, std::string_view)>;

/**
 *  Sets the minimum level that is emitted. Defaults to kWarning.
 *
 *  @param      level  Items below this level are discarded.
 */
void setLogLevel(LogLevel level) noexcept;

/**
 *  Returns the current minimum level.
 */
[[nodiscard]] auto logLevel() noexcept -> LogLevel;

/**
 *  Checks whether items of the given level are currently emitted.
 *
 *  @param      level  The level to test.
 *  @return     True if an item at this level would reach the sink.
 */
[[nodiscard]] auto isLogEnabled(LogLevel level) noexcept -> bool;

/**
 *  Replaces the log sink.
 *
 *  Passing an empty function restores the default stderr sink.
 *
 *  @param      sink  The new sink.
 */
void setLogSink(LogSink sink);

/**
 *  Writes a pre-formatted item to the sink, subject to the level filter.
 *
 *  @param      level     The item level.
 *  @param      location  The originating file and line.
 *  @param      message   The message text.
 */
void logMessage(LogLevel level, const SourceLocation& location, std::string_view message);

// internal helper used by the macros; use the macros for convenience sake
namespace detail
{

template <typename... Args>
void logFormatted(LogLevel level, const SourceLocation& location,
                  fmt::format_string<Args...> format, Args&&... args)
{
    if (!isLogEnabled(level))
    {
        return;
    }
    logMessage(level, location, fmt::format(format, std::forward<Args>(args)...));
}

}  // namespace detail

}  // namespace pipa::core

#endif  // PIPA_CORE_LOGGING_HPP_
