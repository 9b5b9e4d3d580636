/**
 *  @file       test_performance_counter.cpp
 *
 *  Unit tests for PerformanceCounter and counter configuration.
 *
 *  Note: Opening counters requires CAP_PERFMON or perf_event_paranoid <= 1.
 *  Tests that require privileges will be skipped if permissions are insufficient.
 */

#include "pipa/collection/performance_counter.hpp"
#include "pipa/core/errors.hpp"
#include "pipa/core/records.hpp"
#include "pipa/core/types.hpp"

#include <catch2/catch_test_macros.hpp>
#include <cstdint>
#include <fstream>
#include <utility>

using pipa::collection::CounterConfig;
using pipa::collection::PerformanceCounter;
using pipa::collection::StandardEvent;
using pipa::collection::toString;
using pipa::collection::validateConfig;
using pipa::core::PerfError;

namespace
{

/**
 *  Checks if PMU access is permitted on this system.
 *
 *  @return     True if perf_event_paranoid allows user-space PMU access.
 */
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
 *  Burns some CPU time so that counters have something to count.
 */
void spin()
{
    volatile std::uint64_t sum = 0;
    for (std::uint64_t i = 0; i < 1000000; ++i)
    {
        sum += i;
    }
    (void)sum;
}

}  // namespace

TEST_CASE("StandardEvent toString", "[collection][StandardEvent]")
{
    REQUIRE(toString(StandardEvent::kCycles) == "cycles");
    REQUIRE(toString(StandardEvent::kInstructions) == "instructions");
    REQUIRE(toString(StandardEvent::kLlcLoads) == "LLC-loads");
    REQUIRE(toString(StandardEvent::kLlcLoadMisses) == "LLC-load-misses");
    REQUIRE(toString(StandardEvent::kTaskClock) == "task-clock");
    REQUIRE(toString(StandardEvent::kPageFaults) == "page-faults");
}

TEST_CASE("CounterConfig forEvent", "[collection][CounterConfig]")
{
    SECTION("hardware events are user-space only by default")
    {
        auto config = CounterConfig::forEvent(StandardEvent::kInstructions);
        REQUIRE(config.type == pipa::core::EventType::kHardware);
        REQUIRE(config.label == "instructions");
        REQUIRE(config.exclude_kernel);
        REQUIRE_FALSE(config.exclude_user);
        REQUIRE(config.sample_period == 0);
        REQUIRE(config.pid == pipa::core::kCallingThread);
        REQUIRE(config.cpu == pipa::core::kAnyCpu);
    }

    SECTION("cache events use the hardware cache namespace")
    {
        auto config = CounterConfig::forEvent(StandardEvent::kLlcLoadMisses);
        REQUIRE(config.type == pipa::core::EventType::kHardwareCache);
    }

    SECTION("clock events are software events")
    {
        auto config = CounterConfig::forEvent(StandardEvent::kTaskClock, 1234, 2);
        REQUIRE(config.type == pipa::core::EventType::kSoftware);
        REQUIRE(config.pid == 1234);
        REQUIRE(config.cpu == 2);
    }

    SECTION("default configurations are valid")
    {
        REQUIRE(validateConfig(CounterConfig::forEvent(StandardEvent::kCycles)).has_value());
    }
}

TEST_CASE("validateConfig rejects unusable configurations", "[collection][CounterConfig]")
{
    auto config = CounterConfig::forEvent(StandardEvent::kCycles);

    SECTION("every privilege level excluded")
    {
        config.exclude_kernel = true;
        config.exclude_user = true;
        config.exclude_hv = true;
    }

    SECTION("every task on every CPU")
    {
        config.pid = pipa::core::kAllProcesses;
        config.cpu = pipa::core::kAnyCpu;
    }

    SECTION("negative CPU other than any")
    {
        config.cpu = -2;
    }

    SECTION("frequency mode without a frequency")
    {
        config.use_frequency = true;
        config.sample_period = 0;
    }

    SECTION("unknown read format bits")
    {
        config.read_format |= 1ULL << 10;
    }

    SECTION("unsupported sample fields")
    {
        config.sample_period = 1000;
        config.sample_type = 1ULL << 40;
    }

    SECTION("inherited group reads")
    {
        config.inherit = true;
        config.read_format |= pipa::core::kFormatGroup;
    }

    auto result = validateConfig(config);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error() == PerfError::kInvalidConfig);
}

TEST_CASE("PerformanceCounter open rejects invalid configuration without a syscall",
          "[collection][PerformanceCounter]")
{
    auto config = CounterConfig::forEvent(StandardEvent::kCycles);
    config.exclude_user = true;

    auto counter = PerformanceCounter::open(config);

    REQUIRE_FALSE(counter.has_value());
    REQUIRE(counter.error() == PerfError::kInvalidConfig);
}

TEST_CASE("PerformanceCounter creation requires permissions", "[collection][PerformanceCounter]")
{
    auto counter = PerformanceCounter::open(CounterConfig::forEvent(StandardEvent::kTaskClock));

    if (!hasPmuAccess())
    {
        // Software events may still be allowed at paranoid level 2
        if (!counter.has_value())
        {
            REQUIRE(counter.error() == PerfError::kPermissionDenied);
        }
    }
    else
    {
        REQUIRE(counter.has_value());
        REQUIRE(counter->isValid());
        REQUIRE(counter->config().label == "task-clock");
    }
}

TEST_CASE("PerformanceCounter invalid target", "[collection][PerformanceCounter]")
{
    auto counter = PerformanceCounter::open(
        CounterConfig::forEvent(StandardEvent::kTaskClock, 999999999));

    REQUIRE_FALSE(counter.has_value());
    REQUIRE((counter.error() == PerfError::kInvalidTarget ||
             counter.error() == PerfError::kPermissionDenied));
}

TEST_CASE("PerformanceCounter move semantics", "[collection][PerformanceCounter]")
{
    if (!hasPmuAccess())
    {
        SKIP("PMU access not permitted (perf_event_paranoid > 1)");
    }

    auto counter1 = PerformanceCounter::open(CounterConfig::forEvent(StandardEvent::kTaskClock));
    REQUIRE(counter1.has_value());

    int original_fd = counter1->fileDescriptor();

    // Move construct
    PerformanceCounter counter2 = std::move(*counter1);
    REQUIRE(counter2.isValid());
    REQUIRE(counter2.fileDescriptor() == original_fd);
    REQUIRE_FALSE(counter1->isValid());

    // Move assign
    auto counter3 = PerformanceCounter::open(CounterConfig::forEvent(StandardEvent::kCpuClock));
    REQUIRE(counter3.has_value());

    counter3 = std::move(counter2);
    REQUIRE(counter3->isValid());
    REQUIRE(counter3->fileDescriptor() == original_fd);
    REQUIRE(counter3->config().label == "task-clock");
    REQUIRE_FALSE(counter2.isValid());
}

TEST_CASE("PerformanceCounter read returns value with times", "[collection][PerformanceCounter]")
{
    if (!hasPmuAccess())
    {
        SKIP("PMU access not permitted (perf_event_paranoid > 1)");
    }

    auto counter = PerformanceCounter::open(CounterConfig::forEvent(StandardEvent::kTaskClock));
    REQUIRE(counter.has_value());

    REQUIRE(counter->reset().has_value());
    REQUIRE(counter->enable().has_value());
    spin();
    REQUIRE(counter->disable().has_value());

    auto count = counter->read();
    REQUIRE(count.has_value());
    REQUIRE(count->value > 0);
    REQUIRE(count->time_enabled > 0);
    REQUIRE(count->time_running <= count->time_enabled);
}

TEST_CASE("PerformanceCounter id is available", "[collection][PerformanceCounter]")
{
    if (!hasPmuAccess())
    {
        SKIP("PMU access not permitted (perf_event_paranoid > 1)");
    }

    auto first = PerformanceCounter::open(CounterConfig::forEvent(StandardEvent::kTaskClock));
    auto second = PerformanceCounter::open(CounterConfig::forEvent(StandardEvent::kTaskClock));
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());

    auto first_id = first->id();
    auto second_id = second->id();
    REQUIRE(first_id.has_value());
    REQUIRE(second_id.has_value());
    REQUIRE(*first_id != *second_id);
}

TEST_CASE("PerformanceCounter operations on invalid counter fail",
          "[collection][PerformanceCounter]")
{
    if (!hasPmuAccess())
    {
        SKIP("PMU access not permitted (perf_event_paranoid > 1)");
    }

    auto counter = PerformanceCounter::open(CounterConfig::forEvent(StandardEvent::kTaskClock));
    REQUIRE(counter.has_value());

    counter->close();
    REQUIRE_FALSE(counter->isValid());

    SECTION("read on closed counter fails")
    {
        auto result = counter->read();
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error() == PerfError::kInvalidState);
    }

    SECTION("enable on closed counter fails")
    {
        auto result = counter->enable();
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error() == PerfError::kInvalidState);
    }

    SECTION("reset on closed counter fails")
    {
        auto result = counter->reset();
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error() == PerfError::kInvalidState);
    }
}
