/**
 *  @file       test_counter_group.cpp
 *
 *  Unit tests for CounterGroup and multiplexing correction.
 *
 *  Note: Many PMU operations require CAP_PERFMON or perf_event_paranoid <= 1.
 *  Tests that require privileges will be skipped if permissions are insufficient.
 */

#include "pipa/collection/counter_group.hpp"
#include "pipa/collection/performance_counter.hpp"
#include "pipa/core/errors.hpp"

#include <array>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cstdint>
#include <fstream>
#include <span>
#include <utility>
#include <vector>

using Catch::Matchers::WithinRel;
using pipa::collection::CounterConfig;
using pipa::collection::CounterGroup;
using pipa::collection::decodeGroupRead;
using pipa::collection::GroupState;
using pipa::collection::scaleCount;
using pipa::collection::scaleSnapshot;
using pipa::collection::StandardEvent;
using pipa::core::PerfError;

namespace
{

/**
 *  Checks if PMU access is permitted on this system.
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
 *  Two software clocks, which every kernel with perf support provides.
 */
auto clockConfigs() -> std::array<CounterConfig, 2>
{
    return {CounterConfig::forEvent(StandardEvent::kTaskClock),
            CounterConfig::forEvent(StandardEvent::kCpuClock)};
}

}  // namespace

TEST_CASE("scaleCount corrects for multiplexing", "[collection][scaleCount]")
{
    SECTION("counter that ran the whole time is not scaled")
    {
        auto scaled = scaleCount(1000, 500, 500);
        REQUIRE(scaled.has_value());
        REQUIRE(*scaled == 1000.0);
    }

    SECTION("counter that ran half the time is doubled")
    {
        auto scaled = scaleCount(1000, 200, 100);
        REQUIRE(scaled.has_value());
        REQUIRE_THAT(*scaled, WithinRel(2000.0, 1e-12));
        REQUIRE(*scaled > 1000.0);
    }

    SECTION("counter that never ran has no estimate")
    {
        REQUIRE_FALSE(scaleCount(0, 1000, 0).has_value());
        REQUIRE_FALSE(scaleCount(1234, 1000, 0).has_value());
    }

    SECTION("running time above enabled time is treated as full coverage")
    {
        auto scaled = scaleCount(42, 100, 101);
        REQUIRE(scaled.has_value());
        REQUIRE(*scaled == 42.0);
    }
}

TEST_CASE("decodeGroupRead parses the group read layout", "[collection][decodeGroupRead]")
{
    // nr, time_enabled, time_running, {value, id} x nr
    std::vector<std::uint64_t> words{2, 300, 100, 10, 7, 20, 8};

    SECTION("valid buffer")
    {
        auto snapshot = decodeGroupRead(words, 2);
        REQUIRE(snapshot.has_value());
        REQUIRE(snapshot->time_enabled == 300);
        REQUIRE(snapshot->time_running == 100);
        REQUIRE(snapshot->entries.size() == 2);
        REQUIRE(snapshot->entries[0].id == 7);
        REQUIRE(snapshot->entries[0].value == 10);
        REQUIRE(snapshot->entries[1].id == 8);
        REQUIRE(snapshot->entries[1].value == 20);
    }

    SECTION("member count mismatch")
    {
        auto snapshot = decodeGroupRead(words, 3);
        REQUIRE_FALSE(snapshot.has_value());
        REQUIRE(snapshot.error() == PerfError::kReadFailed);
    }

    SECTION("truncated buffer")
    {
        auto snapshot = decodeGroupRead(std::span{words}.first(5), 2);
        REQUIRE_FALSE(snapshot.has_value());
        REQUIRE(snapshot.error() == PerfError::kReadFailed);
    }

    SECTION("buffer shorter than the header")
    {
        auto snapshot = decodeGroupRead(std::span{words}.first(2), 2);
        REQUIRE_FALSE(snapshot.has_value());
        REQUIRE(snapshot.error() == PerfError::kReadFailed);
    }
}

TEST_CASE("scaleSnapshot applies the shared times to every member",
          "[collection][scaleSnapshot]")
{
    std::vector<std::uint64_t> words{2, 300, 100, 10, 7, 20, 8};
    auto snapshot = decodeGroupRead(words, 2);
    REQUIRE(snapshot.has_value());

    auto values = scaleSnapshot(*snapshot);

    REQUIRE(values.size() == 2);
    REQUIRE(values.at(7).raw == 10);
    REQUIRE(values.at(7).wasMultiplexed());
    REQUIRE_THAT(*values.at(7).scaled, WithinRel(30.0, 1e-12));
    REQUIRE_THAT(*values.at(8).scaled, WithinRel(60.0, 1e-12));
}

TEST_CASE("scaleSnapshot leaves unscheduled groups without estimates",
          "[collection][scaleSnapshot]")
{
    std::vector<std::uint64_t> words{1, 500, 0, 99, 3};
    auto snapshot = decodeGroupRead(words, 1);
    REQUIRE(snapshot.has_value());

    auto values = scaleSnapshot(*snapshot);

    REQUIRE(values.at(3).raw == 99);
    REQUIRE_FALSE(values.at(3).scaled.has_value());
}

TEST_CASE("CounterGroup rejects an empty member list", "[collection][CounterGroup]")
{
    auto group = CounterGroup::create(std::span<const CounterConfig>{});

    REQUIRE_FALSE(group.has_value());
    REQUIRE(group.error() == PerfError::kInvalidConfig);
}

TEST_CASE("CounterGroup creation requires permissions", "[collection][CounterGroup]")
{
    auto configs = clockConfigs();
    auto group = CounterGroup::create(configs);

    if (!hasPmuAccess())
    {
        if (!group.has_value())
        {
            REQUIRE(group.error() == PerfError::kPermissionDenied);
        }
    }
    else
    {
        REQUIRE(group.has_value());
        REQUIRE(group->isValid());
        REQUIRE(group->size() == 2);
        REQUIRE(group->state() == GroupState::kCreated);
    }
}

TEST_CASE("CounterGroup labels members by event id", "[collection][CounterGroup]")
{
    if (!hasPmuAccess())
    {
        SKIP("PMU access not permitted (perf_event_paranoid > 1)");
    }

    auto configs = clockConfigs();
    auto group = CounterGroup::create(configs);
    REQUIRE(group.has_value());

    auto ids = group->counterIds();
    REQUIRE(ids.size() == 2);
    REQUIRE(ids[0] != ids[1]);

    REQUIRE(group->labelOf(ids[0]) == "task-clock");
    REQUIRE(group->labelOf(ids[1]) == "cpu-clock");
    REQUIRE(group->idOf("cpu-clock") == ids[1]);
    REQUIRE_FALSE(group->idOf("cycles").has_value());

    auto labels = group->labels();
    REQUIRE(labels.size() == 2);
    REQUIRE(labels.at(ids[0]) == "task-clock");
}

TEST_CASE("CounterGroup start/stop lifecycle", "[collection][CounterGroup]")
{
    if (!hasPmuAccess())
    {
        SKIP("PMU access not permitted (perf_event_paranoid > 1)");
    }

    auto configs = clockConfigs();
    auto group = CounterGroup::create(configs);
    REQUIRE(group.has_value());

    SECTION("stop before start fails")
    {
        auto result = group->stop();
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error() == PerfError::kInvalidState);
    }

    SECTION("start then stop")
    {
        REQUIRE(group->start().has_value());
        REQUIRE(group->state() == GroupState::kEnabled);
        REQUIRE(group->stop().has_value());
        REQUIRE(group->state() == GroupState::kDisabled);
    }

    SECTION("a stopped group can be restarted")
    {
        REQUIRE(group->start().has_value());
        REQUIRE(group->stop().has_value());
        REQUIRE(group->start().has_value());
        REQUIRE(group->state() == GroupState::kEnabled);
    }

    SECTION("closed group rejects every operation")
    {
        group->close();
        REQUIRE(group->state() == GroupState::kClosed);
        REQUIRE_FALSE(group->start().has_value());
        REQUIRE_FALSE(group->reset().has_value());
        REQUIRE_FALSE(group->readAll().has_value());
    }
}

TEST_CASE("CounterGroup readAll returns scaled values", "[collection][CounterGroup]")
{
    if (!hasPmuAccess())
    {
        SKIP("PMU access not permitted (perf_event_paranoid > 1)");
    }

    auto configs = clockConfigs();
    auto group = CounterGroup::create(configs);
    REQUIRE(group.has_value());

    REQUIRE(group->reset().has_value());
    REQUIRE(group->start().has_value());

    volatile std::uint64_t sum = 0;
    for (std::uint64_t i = 0; i < 1000000; ++i)
    {
        sum += i;
    }
    (void)sum;

    REQUIRE(group->stop().has_value());

    auto values = group->readAll();
    REQUIRE(values.has_value());
    REQUIRE(values->size() == 2);

    for (auto id : group->counterIds())
    {
        const auto& value = values->at(id);
        REQUIRE(value.raw > 0);
        REQUIRE(value.scaled.has_value());
        REQUIRE(*value.scaled >= static_cast<double>(value.raw));
    }
}

TEST_CASE("CounterGroup move semantics", "[collection][CounterGroup]")
{
    if (!hasPmuAccess())
    {
        SKIP("PMU access not permitted (perf_event_paranoid > 1)");
    }

    auto configs = clockConfigs();
    auto group1 = CounterGroup::create(configs);
    REQUIRE(group1.has_value());

    int leader_fd = group1->leaderFileDescriptor();

    CounterGroup group2 = std::move(*group1);
    REQUIRE(group2.isValid());
    REQUIRE(group2.leaderFileDescriptor() == leader_fd);
    REQUIRE_FALSE(group1->isValid());
}
