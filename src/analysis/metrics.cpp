/**
 *  @file       metrics.cpp
 *
 *  Implementation of derived metrics.
 */

#include "pipa/analysis/metrics.hpp"

#include "pipa/collection/counter_group.hpp"
#include "pipa/collection/performance_counter.hpp"
#include "pipa/collection/proc_stat_source.hpp"
#include "pipa/core/records.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <span>
#include <string>

namespace pipa::analysis
{

namespace
{

/**
 *  Divides two quantities, or returns std::nullopt if either is absent or
 *  the denominator is not positive.
 */
auto ratio(std::optional<double> numerator, std::optional<double> denominator) noexcept
    -> std::optional<double>
{
    if (!numerator || !denominator || *denominator <= 0.0)
    {
        return std::nullopt;
    }
    return *numerator / *denominator;
}

}  // namespace

auto computeMetrics(const CounterTotals& totals, const SampleSummary& samples,
                    std::uint64_t transaction_count, std::chrono::duration<double> wall_time,
                    const std::optional<collection::CpuUtilization>& utilization) -> Metrics
{
    Metrics metrics;

    metrics.cpi = ratio(totals.cycles, totals.instructions);
    metrics.ipc = ratio(totals.instructions, totals.cycles);

    if (transaction_count > 0)
    {
        auto transactions = static_cast<double>(transaction_count);
        metrics.throughput = ratio(transactions, wall_time.count());
        metrics.path_length = ratio(totals.instructions, transactions);
    }

    metrics.sample_count = samples.sample_count;
    metrics.lost_samples = samples.lost;

    if (utilization)
    {
        metrics.cpu_busy = utilization->busy;
    }

    return metrics;
}

auto summarizeSamples(std::span<const core::SampleRecord> samples, std::uint64_t lost)
    -> SampleSummary
{
    SampleSummary summary;
    summary.sample_count = samples.size();
    summary.lost = lost;

    std::set<std::uint32_t> threads;
    for (const auto& sample : samples)
    {
        if (sample.tid)
        {
            threads.insert(*sample.tid);
        }

        if (sample.time)
        {
            if (!summary.first_time_ns || *sample.time < *summary.first_time_ns)
            {
                summary.first_time_ns = sample.time;
            }
            if (!summary.last_time_ns || *sample.time > *summary.last_time_ns)
            {
                summary.last_time_ns = sample.time;
            }
        }

        if (sample.period)
        {
            summary.last_period = sample.period;
        }
    }
    summary.thread_count = threads.size();

    return summary;
}

auto totalsFromReading(const std::map<std::uint64_t, collection::ScaledValue>& reading,
                       const std::map<std::uint64_t, std::string>& labels) -> CounterTotals
{
    CounterTotals totals;

    for (const auto& [id, value] : reading)
    {
        auto label = labels.find(id);
        if (label == labels.end())
        {
            continue;
        }

        if (label->second == collection::toString(collection::StandardEvent::kCycles))
        {
            totals.cycles = value.scaled;
        }
        else if (label->second == collection::toString(collection::StandardEvent::kInstructions))
        {
            totals.instructions = value.scaled;
        }
    }

    return totals;
}

}  // namespace pipa::analysis
