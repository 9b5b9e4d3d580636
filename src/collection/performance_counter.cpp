/**
 *  @file       performance_counter.cpp
 *
 *  Implementation of the PerformanceCounter class using Linux perf_event_open().
 */

#include "pipa/collection/performance_counter.hpp"

#include "pipa/core/errors.hpp"
#include "pipa/core/logging.hpp"
#include "pipa/core/records.hpp"
#include "pipa/core/types.hpp"

#include <array>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <expected>
#include <linux/perf_event.h>
#include <string>
#include <sys/ioctl.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>
#include <utility>

namespace pipa::collection
{

namespace
{

/**
 *  Wrapper for the perf_event_open syscall.
 *
 *  glibc does not provide a wrapper for perf_event_open(), so we must invoke
 *  the syscall directly. This is the standard approach used by perf tools.
 *
 *  @param      attr      Pointer to perf_event_attr configuration structure.
 *  @param      pid       Process/thread ID to monitor (0 for calling thread).
 *  @param      cpu       CPU to monitor (-1 for any CPU the thread runs on).
 *  @param      group_fd  File descriptor of group leader (-1 for new group).
 *  @param      flags     Additional flags (usually 0).
 *  @return     File descriptor on success, -1 on error with errno set.
 */
auto perfEventOpen(perf_event_attr* attr, pid_t pid, int cpu, int group_fd, unsigned long flags)
    -> int
{
    return static_cast<int>(syscall(SYS_perf_event_open, attr, pid, cpu, group_fd, flags));
}

/**
 *  Encodes a hardware cache event config.
 *
 *  Cache events use a composite config value encoding three fields:
 *  - bits 0-7:   cache ID (L1D, L1I, LL, DTLB, ITLB, BPU, NODE)
 *  - bits 8-15:  operation (READ, WRITE, PREFETCH)
 *  - bits 16-23: result (ACCESS, MISS)
 */
constexpr auto cacheConfig(std::uint64_t cache_id, std::uint64_t op_id, std::uint64_t result_id)
    -> std::uint64_t
{
    return cache_id | (op_id << 8) | (result_id << 16);
}

auto toKernelType(core::EventType type) -> std::uint32_t
{
    switch (type)
    {
        case core::EventType::kHardware:
            return PERF_TYPE_HARDWARE;
        case core::EventType::kSoftware:
            return PERF_TYPE_SOFTWARE;
        case core::EventType::kTracepoint:
            return PERF_TYPE_TRACEPOINT;
        case core::EventType::kHardwareCache:
            return PERF_TYPE_HW_CACHE;
        case core::EventType::kRaw:
            return PERF_TYPE_RAW;
    }
    return PERF_TYPE_HARDWARE;
}

/**
 *  Builds the perf_event_attr for a configuration.
 *
 *  @param      config     The counter configuration.
 *  @param      is_leader  True unless the counter joins an existing group.
 *  @return     Configured perf_event_attr structure ready for perf_event_open().
 */
auto makeEventAttr(const CounterConfig& config, bool is_leader) -> perf_event_attr
{
    perf_event_attr attr{};

    // perf_event_attr has many optional fields that must be zero if unused.
    std::memset(&attr, 0, sizeof(attr));

    attr.type = toKernelType(config.type);
    attr.size = sizeof(attr);  // Required for kernel version compatibility
    attr.config = config.config;

    // Leaders start disabled so the whole group can be set up first;
    // members inherit enabled/disabled state from the leader.
    attr.disabled = is_leader ? 1 : 0;

    attr.exclude_kernel = config.exclude_kernel ? 1 : 0;
    attr.exclude_user = config.exclude_user ? 1 : 0;
    attr.exclude_hv = config.exclude_hv ? 1 : 0;

    if (config.use_frequency)
    {
        attr.freq = 1;
        attr.sample_freq = config.sample_period;
    }
    else
    {
        attr.sample_period = config.sample_period;
    }

    attr.sample_type = config.sample_type;
    attr.read_format =
        config.read_format | core::kFormatTotalTimeEnabled | core::kFormatTotalTimeRunning;
    attr.wakeup_events = config.wakeup_events;

    attr.inherit = config.inherit ? 1 : 0;
    attr.enable_on_exec = config.enable_on_exec ? 1 : 0;

    return attr;
}

/**
 *  Maps errno values from perf_event_open() to PerfError.
 *
 *  @param      err  The errno value to translate.
 *  @return     The corresponding PerfError value.
 */
auto errnoToPerfError(int err) -> core::PerfError
{
    switch (err)
    {
        case EACCES:
        case EPERM:
            // Lacks CAP_PERFMON, or perf_event_paranoid forbids this scope
            return core::PerfError::kPermissionDenied;

        case ENOENT:
        case ENODEV:
        case EOPNOTSUPP:
            return core::PerfError::kEventNotSupported;

        case ESRCH:
            return core::PerfError::kInvalidTarget;

        case EINVAL:
        case E2BIG:
        case EOVERFLOW:
            return core::PerfError::kInvalidConfig;

        case EMFILE:
        case ENFILE:
        case EBUSY:
        case ENOSPC:
            // Descriptors or hardware counters exhausted
            return core::PerfError::kResourceExhausted;

        default:
            return core::PerfError::kOpenFailed;
    }
}

}  // namespace

auto CounterConfig::forEvent(StandardEvent event, pid_t pid, core::CpuTarget cpu) -> CounterConfig
{
    CounterConfig config{};
    config.pid = pid;
    config.cpu = cpu;
    config.label = std::string(toString(event));

    switch (event)
    {
        case StandardEvent::kCycles:
            config.config = PERF_COUNT_HW_CPU_CYCLES;
            break;
        case StandardEvent::kInstructions:
            config.config = PERF_COUNT_HW_INSTRUCTIONS;
            break;
        case StandardEvent::kCacheReferences:
            config.config = PERF_COUNT_HW_CACHE_REFERENCES;
            break;
        case StandardEvent::kCacheMisses:
            config.config = PERF_COUNT_HW_CACHE_MISSES;
            break;
        case StandardEvent::kBranchInstructions:
            config.config = PERF_COUNT_HW_BRANCH_INSTRUCTIONS;
            break;
        case StandardEvent::kBranchMisses:
            config.config = PERF_COUNT_HW_BRANCH_MISSES;
            break;
        case StandardEvent::kLlcLoads:
            config.type = core::EventType::kHardwareCache;
            config.config = cacheConfig(PERF_COUNT_HW_CACHE_LL, PERF_COUNT_HW_CACHE_OP_READ,
                                        PERF_COUNT_HW_CACHE_RESULT_ACCESS);
            break;
        case StandardEvent::kLlcLoadMisses:
            config.type = core::EventType::kHardwareCache;
            config.config = cacheConfig(PERF_COUNT_HW_CACHE_LL, PERF_COUNT_HW_CACHE_OP_READ,
                                        PERF_COUNT_HW_CACHE_RESULT_MISS);
            break;
        case StandardEvent::kTaskClock:
            config.type = core::EventType::kSoftware;
            config.config = PERF_COUNT_SW_TASK_CLOCK;
            break;
        case StandardEvent::kCpuClock:
            config.type = core::EventType::kSoftware;
            config.config = PERF_COUNT_SW_CPU_CLOCK;
            break;
        case StandardEvent::kContextSwitches:
            config.type = core::EventType::kSoftware;
            config.config = PERF_COUNT_SW_CONTEXT_SWITCHES;
            break;
        case StandardEvent::kPageFaults:
            config.type = core::EventType::kSoftware;
            config.config = PERF_COUNT_SW_PAGE_FAULTS;
            break;
    }

    return config;
}

auto validateConfig(const CounterConfig& config) -> std::expected<void, core::PerfError>
{
    // Nothing left to count
    if (config.exclude_kernel && config.exclude_user && config.exclude_hv)
    {
        return std::unexpected(core::PerfError::kInvalidConfig);
    }

    // pid=-1 with cpu=-1 would mean every task on every CPU, which
    // perf_event_open(2) does not accept
    if (config.pid == core::kAllProcesses && config.cpu == core::kAnyCpu)
    {
        return std::unexpected(core::PerfError::kInvalidConfig);
    }

    if (config.pid < core::kAllProcesses || config.cpu < core::kAnyCpu)
    {
        return std::unexpected(core::PerfError::kInvalidConfig);
    }

    if (config.use_frequency && config.sample_period == 0)
    {
        return std::unexpected(core::PerfError::kInvalidConfig);
    }

    if (config.type == core::EventType::kTracepoint && config.config == 0)
    {
        return std::unexpected(core::PerfError::kInvalidConfig);
    }

    if ((config.read_format & ~core::kSupportedReadFormat) != 0)
    {
        return std::unexpected(core::PerfError::kInvalidConfig);
    }

    // Inherited counters cannot be read as a group
    if (config.inherit && (config.read_format & core::kFormatGroup) != 0)
    {
        return std::unexpected(core::PerfError::kInvalidConfig);
    }

    return core::validateLayout(core::SampleLayout{
        .sample_type = config.sample_type,
        .read_format = config.read_format,
    });
}

PerformanceCounter::PerformanceCounter(int fd, CounterConfig config) noexcept
    : fd_(fd), config_(std::move(config))
{
}

PerformanceCounter::~PerformanceCounter()
{
    close();
}

PerformanceCounter::PerformanceCounter(PerformanceCounter&& other) noexcept
    : fd_(std::exchange(other.fd_, kInvalidFd)), config_(std::move(other.config_))
{
}

auto PerformanceCounter::operator=(PerformanceCounter&& other) noexcept -> PerformanceCounter&
{
    if (this != &other)
    {
        // Close our existing fd before taking ownership of other's
        close();

        fd_ = std::exchange(other.fd_, kInvalidFd);
        config_ = std::move(other.config_);
    }
    return *this;
}

auto PerformanceCounter::open(const CounterConfig& config, int group_fd)
    -> std::expected<PerformanceCounter, core::PerfError>
{
    if (auto valid = validateConfig(config); !valid)
    {
        PIPA_LOG_DEBUG("rejected configuration for '{}': {}", config.label,
                       core::toString(valid.error()));
        return std::unexpected(valid.error());
    }

    auto attr = makeEventAttr(config, group_fd == -1);

    int fd = perfEventOpen(&attr, config.pid, config.cpu, group_fd, PERF_FLAG_FD_CLOEXEC);

    if (fd < 0)
    {
        int err = errno;
        PIPA_LOG_DEBUG("perf_event_open('{}', type={}, config={:#x}, pid={}, cpu={}) failed: {}",
                       config.label, core::toString(config.type), config.config, config.pid,
                       config.cpu, std::strerror(err));
        return std::unexpected(errnoToPerfError(err));
    }

    return PerformanceCounter{fd, config};
}

auto PerformanceCounter::read() const -> std::expected<RawCount, core::PerfError>
{
    if (fd_ == kInvalidFd)
    {
        return std::unexpected(core::PerfError::kInvalidState);
    }

    if ((config_.read_format & core::kFormatGroup) != 0)
    {
        return std::unexpected(core::PerfError::kInvalidState);
    }

    // Layout: value, time_enabled, time_running, [id]
    std::array<std::uint64_t, 4> words{};
    ssize_t bytes_read = ::read(fd_, words.data(), sizeof(words));

    if (bytes_read < static_cast<ssize_t>(3 * sizeof(std::uint64_t)))
    {
        return std::unexpected(core::PerfError::kReadFailed);
    }

    return RawCount{
        .value = words[0],
        .time_enabled = words[1],
        .time_running = words[2],
    };
}

auto PerformanceCounter::reset() const -> std::expected<void, core::PerfError>
{
    if (fd_ == kInvalidFd)
    {
        return std::unexpected(core::PerfError::kInvalidState);
    }

    if (ioctl(fd_, PERF_EVENT_IOC_RESET, 0) < 0)
    {
        return std::unexpected(core::PerfError::kInvalidState);
    }

    return {};
}

auto PerformanceCounter::enable() const -> std::expected<void, core::PerfError>
{
    if (fd_ == kInvalidFd)
    {
        return std::unexpected(core::PerfError::kInvalidState);
    }

    if (ioctl(fd_, PERF_EVENT_IOC_ENABLE, 0) < 0)
    {
        return std::unexpected(core::PerfError::kInvalidState);
    }

    return {};
}

auto PerformanceCounter::disable() const -> std::expected<void, core::PerfError>
{
    if (fd_ == kInvalidFd)
    {
        return std::unexpected(core::PerfError::kInvalidState);
    }

    // The counter can be read after disabling to get the final count
    if (ioctl(fd_, PERF_EVENT_IOC_DISABLE, 0) < 0)
    {
        return std::unexpected(core::PerfError::kInvalidState);
    }

    return {};
}

auto PerformanceCounter::id() const -> std::expected<std::uint64_t, core::PerfError>
{
    if (fd_ == kInvalidFd)
    {
        return std::unexpected(core::PerfError::kInvalidState);
    }

    std::uint64_t event_id = 0;
    if (ioctl(fd_, PERF_EVENT_IOC_ID, &event_id) < 0)
    {
        return std::unexpected(core::PerfError::kReadFailed);
    }

    return event_id;
}

void PerformanceCounter::close() noexcept
{
    if (fd_ != kInvalidFd)
    {
        ::close(fd_);
        fd_ = kInvalidFd;
    }
}

auto PerformanceCounter::config() const noexcept -> const CounterConfig&
{
    return config_;
}

auto PerformanceCounter::fileDescriptor() const noexcept -> int
{
    return fd_;
}

auto PerformanceCounter::isValid() const noexcept -> bool
{
    return fd_ != kInvalidFd;
}

}  // namespace pipa::collection
