/**
 *  @file       types.hpp
 *
 *  Core type definitions for the PIPA collector.
 *
 *  Defines fundamental types used throughout PIPA for identifying
 *  monitoring targets and classifying perf events.
 */

#ifndef PIPA_CORE_TYPES_HPP_
#define PIPA_CORE_TYPES_HPP_

#include <cstdint>
#include <string_view>

namespace pipa::core
{

/**
 *  Type alias for logical CPU identifiers as seen by the kernel.
 *
 *  Negative values have perf_event_open() semantics: -1 means "any CPU
 *  the target runs on".
 */
using CpuTarget = int;

/**
 *  Monitor the target on whichever CPU it runs.
 */
inline constexpr CpuTarget kAnyCpu = -1;

/**
 *  Process target meaning "all processes" (system-wide; requires a CPU).
 */
inline constexpr int kAllProcesses = -1;

/**
 *  Process target meaning "the calling thread".
 */
inline constexpr int kCallingThread = 0;

/**
 *  Kernel event namespaces understood by the collector.
 *
 *  Each value maps to a PERF_TYPE_* constant.
 */
enum class EventType : std::uint8_t
{
    /**
     *  Generalised hardware events (PERF_TYPE_HARDWARE).
     */
    kHardware = 0,

    /**
     *  Kernel software events such as task-clock (PERF_TYPE_SOFTWARE).
     */
    kSoftware = 1,

    /**
     *  Static kernel tracepoints (PERF_TYPE_TRACEPOINT).
     *
     *  The config value is the tracepoint id from tracefs.
     */
    kTracepoint = 2,

    /**
     *  Hardware cache events (PERF_TYPE_HW_CACHE).
     */
    kHardwareCache = 3,

    /**
     *  Raw CPU-specific event codes (PERF_TYPE_RAW).
     */
    kRaw = 4,
};

/**
 *  Converts an EventType to its human-readable string representation.
 *
 *  @param      type  The event type to convert.
 *  @return     A string view naming the event namespace.
 */
[[nodiscard]] constexpr auto toString(EventType type) noexcept -> std::string_view
{
    switch (type)
    {
        case EventType::kHardware:
            return "hardware";
        case EventType::kSoftware:
            return "software";
        case EventType::kTracepoint:
            return "tracepoint";
        case EventType::kHardwareCache:
            return "hw-cache";
        case EventType::kRaw:
            return "raw";
    }
    return "invalid";
}

}  // namespace pipa::core

#endif  // PIPA_CORE_TYPES_HPP_
