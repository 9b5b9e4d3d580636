/**
 *  @file       proc_stat_source.hpp
 *
 *  System-wide CPU and memory statistics from procfs.
 *
 *  Parses the cumulative CPU time counters of /proc/stat and the memory
 *  snapshot of /proc/meminfo, and turns two successive polls into the
 *  utilization of the interval between them.
 */

#ifndef PIPA_COLLECTION_PROC_STAT_SOURCE_HPP_
#define PIPA_COLLECTION_PROC_STAT_SOURCE_HPP_

#include "pipa/core/errors.hpp"

#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace pipa::collection
{

/**
 *  Cumulative CPU time of one "cpu" line, in clock ticks.
 *
 *  A field is absent when its token is missing or malformed.
 */
struct CpuTimes
{
    std::optional<std::uint64_t> user;
    std::optional<std::uint64_t> nice;
    std::optional<std::uint64_t> system;
    std::optional<std::uint64_t> idle;
    std::optional<std::uint64_t> iowait;
    std::optional<std::uint64_t> irq;
    std::optional<std::uint64_t> softirq;
    std::optional<std::uint64_t> steal;

    /**
     *  Guest time is already included in user and nice.
     */
    std::optional<std::uint64_t> guest;
    std::optional<std::uint64_t> guest_nice;
};

/**
 *  Memory snapshot from /proc/meminfo, in kB.
 */
struct MemoryStats
{
    std::optional<std::uint64_t> total_kb;
    std::optional<std::uint64_t> free_kb;
    std::optional<std::uint64_t> available_kb;
    std::optional<std::uint64_t> buffers_kb;
    std::optional<std::uint64_t> cached_kb;
    std::optional<std::uint64_t> swap_total_kb;
    std::optional<std::uint64_t> swap_free_kb;

    /**
     *  Fraction of memory in use, 1 - available / total.
     *
     *  @return     The fraction, or std::nullopt if either value is absent
     *              or total is zero.
     */
    [[nodiscard]] auto usedFraction() const noexcept -> std::optional<double>;
};

/**
 *  Share of an interval's ticks spent in each state, in [0, 1].
 *
 *  A share is absent when its counter is missing or went backwards.
 */
struct CpuUtilization
{
    /**
     *  Ticks elapsed in the interval across all non-guest states.
     */
    std::uint64_t total_ticks{0};

    std::optional<double> user;
    std::optional<double> nice;
    std::optional<double> system;
    std::optional<double> idle;
    std::optional<double> iowait;
    std::optional<double> irq;
    std::optional<double> softirq;
    std::optional<double> steal;

    /**
     *  1 - (idle + iowait) / total.
     */
    std::optional<double> busy;
};

/**
 *  Everything read by one poll.
 */
struct ProcStatSnapshot
{
    /**
     *  The aggregate "cpu" line.
     */
    CpuTimes cpu;

    /**
     *  The "cpuN" lines, keyed by CPU number.
     */
    std::map<int, CpuTimes> per_cpu;

    MemoryStats memory;

    std::optional<std::uint64_t> context_switches;
    std::optional<std::uint64_t> processes_running;
};

/**
 *  One poll result: the snapshot and the utilization since the previous
 *  poll, absent on the first poll or after a discontinuity.
 */
struct ProcStatSample
{
    ProcStatSnapshot snapshot;
    std::optional<CpuUtilization> utilization;
    std::map<int, CpuUtilization> per_cpu_utilization;
};

/**
 *  Parses one "cpu" or "cpuN" line of /proc/stat.
 *
 *  @param      line  The line, including its label.
 *  @return     The times, or std::nullopt if the line is not a cpu line.
 */
[[nodiscard]] auto parseCpuLine(std::string_view line) -> std::optional<CpuTimes>;

/**
 *  Parses the whole content of /proc/stat.
 *
 *  Unknown and malformed lines are ignored; memory is left empty.
 *
 *  @param      content  The file content.
 *  @return     The parsed snapshot.
 */
[[nodiscard]] auto parseProcStat(std::string_view content) -> ProcStatSnapshot;

/**
 *  Parses the whole content of /proc/meminfo.
 *
 *  @param      content  The file content.
 *  @return     The memory statistics; unknown keys are ignored.
 */
[[nodiscard]] auto parseMeminfo(std::string_view content) -> MemoryStats;

/**
 *  Computes the utilization of the interval between two readings.
 *
 *  A field that went backwards has no share and is left out of the total,
 *  so the shares that are present always sum to one.
 *
 *  @param      previous  The earlier reading.
 *  @param      current   The later reading.
 *  @return     The utilization, or std::nullopt if no ticks elapsed or the
 *              total went backwards.
 */
[[nodiscard]] auto computeUtilization(const CpuTimes& previous, const CpuTimes& current)
    -> std::optional<CpuUtilization>;

/**
 *  Locations of the statistics files.
 */
struct ProcStatPaths
{
    std::string stat{"/proc/stat"};
    std::string meminfo{"/proc/meminfo"};
};

/**
 *  Polls /proc/stat and /proc/meminfo and keeps the previous snapshot for
 *  delta computation.
 *
 *  Owned by exactly one polling loop; not thread-safe.
 */
class ProcStatSource
{
  public:
    /**
     *  Creates a source reading from the given paths.
     *
     *  @param      paths  The file locations.
     *  @return     A source, or ProcStatError if /proc/stat cannot be read.
     */
    [[nodiscard]] static auto create(ProcStatPaths paths = {})
        -> std::expected<ProcStatSource, core::ProcStatError>;

    /**
     *  Reads both files and computes the utilization since the last poll.
     *
     *  A missing meminfo leaves memory empty; an unreadable stat file fails
     *  the poll and keeps the previous snapshot.
     *
     *  @return     The sample, or ProcStatError.
     */
    [[nodiscard]] auto poll() -> std::expected<ProcStatSample, core::ProcStatError>;

    /**
     *  Forgets the previous snapshot; the next poll has no utilization.
     */
    void reset() noexcept;

    [[nodiscard]] auto paths() const noexcept -> const ProcStatPaths&;

  private:
    explicit ProcStatSource(ProcStatPaths paths) noexcept;

    ProcStatPaths paths_;
    std::optional<ProcStatSnapshot> previous_;
};

}  // namespace pipa::collection

#endif  // PIPA_COLLECTION_PROC_STAT_SOURCE_HPP_
