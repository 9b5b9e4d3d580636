/**
 *  @file       performance_counter.hpp
 *
 *  RAII wrapper for a single Linux perf_event counter.
 *
 *  Provides a safe interface for opening, reading, and managing individual
 *  hardware or software counters via the perf_event_open() syscall.
 */

#ifndef PIPA_COLLECTION_PERFORMANCE_COUNTER_HPP_
#define PIPA_COLLECTION_PERFORMANCE_COUNTER_HPP_

#include "pipa/core/errors.hpp"
#include "pipa/core/records.hpp"
#include "pipa/core/types.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <sys/types.h>

namespace pipa::collection
{

/**
 *  Commonly used events with a fixed kernel encoding.
 */
enum class StandardEvent : std::uint8_t
{
    /**
     *  CPU cycles elapsed. Maps to PERF_COUNT_HW_CPU_CYCLES.
     */
    kCycles = 0,

    /**
     *  Instructions retired. Maps to PERF_COUNT_HW_INSTRUCTIONS.
     */
    kInstructions = 1,

    /**
     *  Cache accesses. Maps to PERF_COUNT_HW_CACHE_REFERENCES.
     */
    kCacheReferences = 2,

    /**
     *  Cache misses. Maps to PERF_COUNT_HW_CACHE_MISSES.
     */
    kCacheMisses = 3,

    /**
     *  Retired branch instructions. Maps to PERF_COUNT_HW_BRANCH_INSTRUCTIONS.
     */
    kBranchInstructions = 4,

    /**
     *  Branch mispredictions. Maps to PERF_COUNT_HW_BRANCH_MISSES.
     */
    kBranchMisses = 5,

    /**
     *  Last-level cache read accesses (PERF_TYPE_HW_CACHE).
     */
    kLlcLoads = 6,

    /**
     *  Last-level cache read misses (PERF_TYPE_HW_CACHE).
     */
    kLlcLoadMisses = 7,

    /**
     *  Task clock in nanoseconds. Maps to PERF_COUNT_SW_TASK_CLOCK.
     */
    kTaskClock = 8,

    /**
     *  Per-CPU clock in nanoseconds. Maps to PERF_COUNT_SW_CPU_CLOCK.
     */
    kCpuClock = 9,

    /**
     *  Context switches. Maps to PERF_COUNT_SW_CONTEXT_SWITCHES.
     */
    kContextSwitches = 10,

    /**
     *  Page faults. Maps to PERF_COUNT_SW_PAGE_FAULTS.
     */
    kPageFaults = 11,
};

/**
 *  Converts a StandardEvent to its perf-tool style name.
 *
 *  @param      event  The event to convert.
 *  @return     A string view naming the event.
 */
[[nodiscard]] constexpr auto toString(StandardEvent event) noexcept -> std::string_view
{
    switch (event)
    {
        case StandardEvent::kCycles:
            return "cycles";
        case StandardEvent::kInstructions:
            return "instructions";
        case StandardEvent::kCacheReferences:
            return "cache-references";
        case StandardEvent::kCacheMisses:
            return "cache-misses";
        case StandardEvent::kBranchInstructions:
            return "branch-instructions";
        case StandardEvent::kBranchMisses:
            return "branch-misses";
        case StandardEvent::kLlcLoads:
            return "LLC-loads";
        case StandardEvent::kLlcLoadMisses:
            return "LLC-load-misses";
        case StandardEvent::kTaskClock:
            return "task-clock";
        case StandardEvent::kCpuClock:
            return "cpu-clock";
        case StandardEvent::kContextSwitches:
            return "context-switches";
        case StandardEvent::kPageFaults:
            return "page-faults";
    }
    return "unknown";
}

/**
 *  Everything needed to open one counter.
 *
 *  The defaults describe a user-space-only counting event on the calling
 *  thread, which needs no elevated privileges at perf_event_paranoid <= 2.
 */
struct CounterConfig
{
    core::EventType type{core::EventType::kHardware};

    /**
     *  Event code within the namespace selected by type.
     */
    std::uint64_t config{0};

    bool exclude_kernel{true};
    bool exclude_user{false};
    bool exclude_hv{true};

    /**
     *  Sampling period in events, or frequency in Hz if use_frequency is
     *  set. Zero means pure counting.
     */
    std::uint64_t sample_period{0};
    bool use_frequency{false};

    /**
     *  Sample payload fields (core::kSample* bits).
     */
    std::uint64_t sample_type{0};

    /**
     *  Read format (core::kFormat* bits). Time enabled and time running are
     *  always added so that reads can be corrected for multiplexing.
     */
    std::uint64_t read_format{core::kFormatTotalTimeEnabled | core::kFormatTotalTimeRunning};

    /**
     *  Wake a poll() waiter every N samples (0 lets the kernel decide).
     */
    std::uint32_t wakeup_events{0};

    /**
     *  Process/thread to monitor: 0 for the calling thread, -1 for all.
     */
    pid_t pid{core::kCallingThread};

    core::CpuTarget cpu{core::kAnyCpu};

    /**
     *  Count child tasks created after the counter was opened.
     */
    bool inherit{false};

    /**
     *  Let the kernel enable the counter when the target calls execve().
     */
    bool enable_on_exec{false};

    /**
     *  Human-readable name used in readings and logs.
     */
    std::string label;

    /**
     *  Builds the configuration of a standard event.
     *
     *  @param      event  The event to count.
     *  @param      pid    Process/thread to monitor.
     *  @param      cpu    CPU to monitor.
     *  @return     A counting configuration labelled with the event name.
     */
    [[nodiscard]] static auto forEvent(StandardEvent event, pid_t pid = core::kCallingThread,
                                       core::CpuTarget cpu = core::kAnyCpu) -> CounterConfig;
};

/**
 *  Rejects combinations the kernel would refuse or that cannot count.
 *
 *  @param      config  The configuration to check.
 *  @return     Success, or PerfError::kInvalidConfig.
 */
[[nodiscard]] auto validateConfig(const CounterConfig& config) -> std::expected<void, core::PerfError>;

/**
 *  A raw counter value with its multiplexing times.
 */
struct RawCount
{
    std::uint64_t value;

    /**
     *  Nanoseconds the counter was enabled.
     */
    std::uint64_t time_enabled;

    /**
     *  Nanoseconds the counter was actually scheduled on the PMU.
     */
    std::uint64_t time_running;
};

/**
 *  RAII wrapper for a single performance counter.
 *
 *  PerformanceCounter exclusively owns a perf_event file descriptor. The
 *  descriptor is released on destruction or by close().
 *
 *  This class is move-only; file descriptors cannot be safely copied.
 *
 *  Example usage:
 *  @code
 *      auto counter = PerformanceCounter::open(CounterConfig::forEvent(StandardEvent::kCycles));
 *      if (!counter) {
 *          // Handle error
 *      }
 *      counter->enable();
 *      // ... workload runs ...
 *      auto count = counter->read();
 *  @endcode
 */
class PerformanceCounter
{
  public:
    /**
     *  Opens a counter for the given configuration.
     *
     *  A counter opened without a group is created disabled; call enable()
     *  to start counting. A counter opened as a group member is created
     *  enabled and follows its leader.
     *
     *  @param      config    The event, target and sampling configuration.
     *  @param      group_fd  Leader descriptor, or -1 to start a new group.
     *  @return     A PerformanceCounter on success, or PerfError on failure.
     */
    [[nodiscard]] static auto open(const CounterConfig& config, int group_fd = -1)
        -> std::expected<PerformanceCounter, core::PerfError>;

    /**
     *  Destroys the counter and closes the file descriptor.
     */
    ~PerformanceCounter();

    PerformanceCounter(PerformanceCounter&& other) noexcept;
    auto operator=(PerformanceCounter&& other) noexcept -> PerformanceCounter&;

    // Non-copyable
    PerformanceCounter(const PerformanceCounter&) = delete;
    auto operator=(const PerformanceCounter&) -> PerformanceCounter& = delete;

    /**
     *  Reads the current counter value with its enabled and running times.
     *
     *  Group leaders use the grouped read format; read them through
     *  CounterGroup instead.
     *
     *  @return     The raw count on success, or PerfError on failure.
     */
    [[nodiscard]] auto read() const -> std::expected<RawCount, core::PerfError>;

    /**
     *  Resets the counter value to zero without closing it.
     *
     *  @return     Success or PerfError on failure.
     */
    [[nodiscard]] auto reset() const -> std::expected<void, core::PerfError>;

    /**
     *  Enables the counter to start accumulating events.
     *
     *  @return     Success or PerfError on failure.
     */
    [[nodiscard]] auto enable() const -> std::expected<void, core::PerfError>;

    /**
     *  Disables the counter. The value is preserved and can still be read.
     *
     *  @return     Success or PerfError on failure.
     */
    [[nodiscard]] auto disable() const -> std::expected<void, core::PerfError>;

    /**
     *  Returns the kernel-assigned event id (PERF_EVENT_IOC_ID).
     *
     *  @return     The id, or PerfError on failure.
     */
    [[nodiscard]] auto id() const -> std::expected<std::uint64_t, core::PerfError>;

    /**
     *  Releases the kernel handle. Closing twice is a no-op.
     */
    void close() noexcept;

    /**
     *  Returns the configuration the counter was opened with.
     */
    [[nodiscard]] auto config() const noexcept -> const CounterConfig&;

    /**
     *  Returns the underlying file descriptor, or -1 if closed.
     */
    [[nodiscard]] auto fileDescriptor() const noexcept -> int;

    /**
     *  Checks if the counter still owns a file descriptor.
     */
    [[nodiscard]] auto isValid() const noexcept -> bool;

  private:
    PerformanceCounter(int fd, CounterConfig config) noexcept;

    static constexpr int kInvalidFd = -1;

    int fd_;
    CounterConfig config_;
};

}  // namespace pipa::collection

#endif  // PIPA_COLLECTION_PERFORMANCE_COUNTER_HPP_
