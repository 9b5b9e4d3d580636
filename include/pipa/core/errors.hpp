/**
 *  @file       errors.hpp
 *
 *  Error types for the PIPA collector.
 *
 *  Defines error enumerations used throughout PIPA for representing
 *  failure conditions in counter acquisition, /proc parsing and workload
 *  management.
 */

#ifndef PIPA_CORE_ERRORS_HPP_
#define PIPA_CORE_ERRORS_HPP_

#include <cstdint>
#include <string_view>

namespace pipa::core
{

/**
 *  Error conditions that can occur during perf_event operations.
 *
 *  These errors are returned via std::expected from counter, group, ring
 *  buffer and sampling session functions when a kernel operation fails or
 *  an operation is issued in the wrong state.
 */
enum class PerfError : std::uint8_t
{
    /**
     *  The perf_event_open() system call failed for an unclassified reason.
     */
    kOpenFailed = 1,

    /**
     *  Reading from the perf event file descriptor failed.
     *
     *  The counter may have been closed, or the kernel returned fewer bytes
     *  than the configured read format requires.
     */
    kReadFailed = 2,

    /**
     *  The requested event is not supported on this hardware or kernel.
     */
    kEventNotSupported = 3,

    /**
     *  The caller lacks the capability to observe the requested scope.
     *
     *  Check /proc/sys/kernel/perf_event_paranoid or use CAP_PERFMON.
     *  Fatal for the counter or session; not retried.
     */
    kPermissionDenied = 4,

    /**
     *  The specified thread or process ID does not exist.
     */
    kInvalidTarget = 5,

    /**
     *  The kernel refused to allocate another counter.
     *
     *  Hardware has a limited number of programmable counters and the
     *  process a limited number of descriptors. The caller may retry with
     *  fewer simultaneous counters.
     */
    kResourceExhausted = 6,

    /**
     *  The operation was invoked in the wrong lifecycle state.
     */
    kInvalidState = 7,

    /**
     *  Invalid event, exclusion or sampling combination.
     *
     *  Indicates a programming or configuration bug; not retried.
     */
    kInvalidConfig = 8,

    /**
     *  Mapping the sampling ring buffer failed.
     */
    kMappingFailed = 9,
};

/**
 *  Converts a PerfError to its human-readable string representation.
 *
 *  @param      error  The error to convert.
 *  @return     A string view describing the error condition.
 */
[[nodiscard]] constexpr auto toString(PerfError error) noexcept -> std::string_view
{
    switch (error)
    {
        case PerfError::kOpenFailed:
            return "perf_event_open() failed";
        case PerfError::kReadFailed:
            return "failed to read perf counter";
        case PerfError::kEventNotSupported:
            return "perf event not supported on this hardware";
        case PerfError::kPermissionDenied:
            return "permission denied for perf_event access";
        case PerfError::kInvalidTarget:
            return "invalid thread or process ID";
        case PerfError::kResourceExhausted:
            return "kernel counter resources exhausted";
        case PerfError::kInvalidState:
            return "operation invalid in current state";
        case PerfError::kInvalidConfig:
            return "invalid counter configuration";
        case PerfError::kMappingFailed:
            return "failed to map sampling buffer";
    }
    return "unknown perf error";
}

/**
 *  Error conditions that can occur while reading /proc statistics.
 *
 *  Only failures to obtain the file at all are errors; malformed content
 *  is reported per field as an absent value.
 */
enum class ProcStatError : std::uint8_t
{
    /**
     *  The statistics file does not exist or could not be opened.
     */
    kFileNotFound = 1,

    /**
     *  Permission was denied when opening the statistics file.
     */
    kPermissionDenied = 2,

    /**
     *  The file was opened but reading its content failed.
     */
    kReadFailed = 3,
};

/**
 *  Converts a ProcStatError to its human-readable string representation.
 *
 *  @param      error  The error to convert.
 *  @return     A string view describing the error condition.
 */
[[nodiscard]] constexpr auto toString(ProcStatError error) noexcept -> std::string_view
{
    switch (error)
    {
        case ProcStatError::kFileNotFound:
            return "statistics file not found";
        case ProcStatError::kPermissionDenied:
            return "permission denied reading statistics file";
        case ProcStatError::kReadFailed:
            return "failed to read statistics file";
    }
    return "unknown proc stat error";
}

/**
 *  Error conditions that can occur while managing a workload process.
 */
enum class WorkloadError : std::uint8_t
{
    /**
     *  The command line was empty.
     */
    kInvalidArguments = 1,

    /**
     *  fork() failed.
     */
    kForkFailed = 2,

    /**
     *  Creating the synchronisation pipes failed.
     */
    kPipeFailed = 3,

    /**
     *  The child could not execute the command.
     */
    kExecFailed = 4,

    /**
     *  waitpid() failed.
     */
    kWaitFailed = 5,

    /**
     *  The workload is not in a state that permits the operation.
     */
    kInvalidState = 6,
};

/**
 *  Converts a WorkloadError to its human-readable string representation.
 *
 *  @param      error  The error to convert.
 *  @return     A string view describing the error condition.
 */
[[nodiscard]] constexpr auto toString(WorkloadError error) noexcept -> std::string_view
{
    switch (error)
    {
        case WorkloadError::kInvalidArguments:
            return "empty workload command";
        case WorkloadError::kForkFailed:
            return "failed to fork workload process";
        case WorkloadError::kPipeFailed:
            return "failed to create workload pipe";
        case WorkloadError::kExecFailed:
            return "failed to execute command";
        case WorkloadError::kWaitFailed:
            return "failed to wait for workload process";
        case WorkloadError::kInvalidState:
            return "workload in invalid state";
    }
    return "unknown workload error";
}

}  // namespace pipa::core

#endif  // PIPA_CORE_ERRORS_HPP_
