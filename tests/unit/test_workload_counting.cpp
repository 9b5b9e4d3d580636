/**
 *  @file       test_workload_counting.cpp
 *
 *  Tests counting a spawned command from exec to exit.
 *
 *  Note: Opening counters on another process requires CAP_PERFMON or
 *  perf_event_paranoid <= 1. Tests are skipped if permissions are insufficient.
 */

#include "pipa/analysis/metrics.hpp"
#include "pipa/collection/counter_group.hpp"
#include "pipa/collection/performance_counter.hpp"
#include "pipa/collection/workload.hpp"
#include "pipa/core/errors.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <chrono>
#include <expected>
#include <fstream>
#include <string>
#include <vector>

using Catch::Matchers::WithinRel;
using pipa::analysis::computeMetrics;
using pipa::analysis::CounterTotals;
using pipa::analysis::SampleSummary;
using pipa::collection::CounterConfig;
using pipa::collection::PerformanceCounter;
using pipa::collection::scaleCount;
using pipa::collection::StandardEvent;
using pipa::collection::Workload;
using pipa::core::PerfError;

namespace
{

auto hasPmuAccess() -> bool
{
    std::ifstream file("/proc/sys/kernel/perf_event_paranoid");
    if (!file)
    {
        return false;
    }

    int level = 0;
    file >> level;

    return level <= 1;
}

/**
 *  A short shell loop, so the command retires a measurable amount of work.
 */
auto busyCommand() -> std::vector<std::string>
{
    return {"sh", "-c", "i=0; while [ $i -lt 20000 ]; do i=$((i + 1)); done"};
}

/**
 *  Configures an event to count the workload and its children from exec.
 */
auto execCounter(StandardEvent event, pid_t pid) -> CounterConfig
{
    auto config = CounterConfig::forEvent(event, pid);
    config.inherit = true;
    config.enable_on_exec = true;
    return config;
}

}  // namespace

TEST_CASE("Counters on a workload start at exec", "[collection][Workload][counting]")
{
    if (!hasPmuAccess())
    {
        SKIP("PMU access not permitted (perf_event_paranoid > 1)");
    }

    auto workload = Workload::spawn(busyCommand());
    REQUIRE(workload.has_value());

    auto counter = PerformanceCounter::open(execCounter(StandardEvent::kTaskClock, workload->pid()));
    REQUIRE(counter.has_value());

    // Held at the gate: nothing has been counted yet
    auto before = counter->read();
    REQUIRE(before.has_value());
    REQUIRE(before->value == 0);
    REQUIRE(before->time_enabled == 0);

    REQUIRE(workload->start().has_value());
    REQUIRE(workload->wait() == 0);

    auto after = counter->read();
    REQUIRE(after.has_value());
    REQUIRE(after->value > 0);
    REQUIRE(after->time_enabled > 0);
}

TEST_CASE("Counting a workload yields its CPI", "[collection][Workload][counting]")
{
    if (!hasPmuAccess())
    {
        SKIP("PMU access not permitted (perf_event_paranoid > 1)");
    }

    auto workload = Workload::spawn(busyCommand());
    REQUIRE(workload.has_value());

    auto cycles = PerformanceCounter::open(execCounter(StandardEvent::kCycles, workload->pid()));
    if (!cycles && cycles.error() == PerfError::kEventNotSupported)
    {
        SKIP("No hardware cycle counter on this machine");
    }
    REQUIRE(cycles.has_value());

    auto instructions =
        PerformanceCounter::open(execCounter(StandardEvent::kInstructions, workload->pid()));
    REQUIRE(instructions.has_value());

    REQUIRE(cycles->read()->value == 0);
    REQUIRE(instructions->read()->value == 0);

    auto started_at = std::chrono::steady_clock::now();
    REQUIRE(workload->start().has_value());
    REQUIRE(workload->wait() == 0);
    std::chrono::duration<double> wall_time = std::chrono::steady_clock::now() - started_at;

    auto cycle_count = cycles->read();
    auto instruction_count = instructions->read();
    REQUIRE(cycle_count.has_value());
    REQUIRE(instruction_count.has_value());

    CounterTotals totals{
        .cycles = scaleCount(cycle_count->value, cycle_count->time_enabled,
                             cycle_count->time_running),
        .instructions = scaleCount(instruction_count->value, instruction_count->time_enabled,
                                   instruction_count->time_running),
    };

    // Both counters may have been multiplexed out for the whole run on a busy PMU
    if (!totals.cycles || !totals.instructions)
    {
        SKIP("Hardware counters never scheduled");
    }
    REQUIRE(*totals.cycles > 0.0);
    REQUIRE(*totals.instructions > 0.0);

    auto metrics = computeMetrics(totals, SampleSummary{}, 1, wall_time);

    REQUIRE(metrics.cpi.has_value());
    REQUIRE_THAT(*metrics.cpi, WithinRel(*totals.cycles / *totals.instructions, 1e-12));
    REQUIRE(metrics.path_length.has_value());
    REQUIRE_THAT(*metrics.path_length, WithinRel(*totals.instructions, 1e-12));
    REQUIRE(metrics.throughput.has_value());
}
