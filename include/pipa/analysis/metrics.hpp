/**
 *  @file       metrics.hpp
 *
 *  Derived performance metrics.
 *
 *  Pure functions of counter totals, a sample summary, a transaction count
 *  and the wall time of a run. Undefined ratios are std::nullopt, never
 *  zero or a sentinel.
 */

#ifndef PIPA_ANALYSIS_METRICS_HPP_
#define PIPA_ANALYSIS_METRICS_HPP_

#include "pipa/collection/counter_group.hpp"
#include "pipa/collection/proc_stat_source.hpp"
#include "pipa/core/records.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>

namespace pipa::analysis
{

/**
 *  Scaled totals of the counters the metrics are built from.
 */
struct CounterTotals
{
    std::optional<double> cycles;
    std::optional<double> instructions;
};

/**
 *  Aggregate view of the samples of a run.
 */
struct SampleSummary
{
    std::uint64_t sample_count{0};
    std::uint64_t lost{0};

    /**
     *  Number of distinct tids among the samples.
     */
    std::size_t thread_count{0};

    std::optional<std::uint64_t> first_time_ns;
    std::optional<std::uint64_t> last_time_ns;

    /**
     *  The period of the most recent sample that carried one.
     */
    std::optional<std::uint64_t> last_period;
};

/**
 *  Metrics of one run.
 */
struct Metrics
{
    /**
     *  Cycles per instruction.
     */
    std::optional<double> cpi;

    /**
     *  Instructions per cycle.
     */
    std::optional<double> ipc;

    /**
     *  Transactions per second of wall time.
     */
    std::optional<double> throughput;

    /**
     *  Instructions per transaction.
     */
    std::optional<double> path_length;

    std::uint64_t sample_count{0};
    std::uint64_t lost_samples{0};

    /**
     *  Busy fraction of the CPUs over the run, if system statistics were
     *  collected.
     */
    std::optional<double> cpu_busy;
};

/**
 *  Computes the metrics of a run.
 *
 *  @param      totals             Scaled cycle and instruction totals.
 *  @param      samples            Summary of the samples of the run.
 *  @param      transaction_count  Units of work completed.
 *  @param      wall_time          Duration of the run.
 *  @param      utilization        CPU utilization over the run, if known.
 *  @return     The metrics; each ratio is std::nullopt when undefined.
 */
[[nodiscard]] auto computeMetrics(const CounterTotals& totals, const SampleSummary& samples,
                                  std::uint64_t transaction_count,
                                  std::chrono::duration<double> wall_time,
                                  const std::optional<collection::CpuUtilization>& utilization = {})
    -> Metrics;

/**
 *  Summarizes a sequence of samples.
 *
 *  @param      samples  Samples in buffer or timestamp order.
 *  @param      lost     Records the kernel reported as lost.
 *  @return     The summary.
 */
[[nodiscard]] auto summarizeSamples(std::span<const core::SampleRecord> samples, std::uint64_t lost)
    -> SampleSummary;

/**
 *  Picks the cycle and instruction totals out of a group reading.
 *
 *  Members are matched by label ("cycles", "instructions"). A member that
 *  never ran yields an absent total, never its raw value.
 *
 *  @param      reading  Scaled values keyed by event id.
 *  @param      labels   Member labels keyed by event id.
 *  @return     The totals.
 */
[[nodiscard]] auto totalsFromReading(const std::map<std::uint64_t, collection::ScaledValue>& reading,
                                     const std::map<std::uint64_t, std::string>& labels)
    -> CounterTotals;

}  // namespace pipa::analysis

#endif  // PIPA_ANALYSIS_METRICS_HPP_
