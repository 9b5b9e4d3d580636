/**
 *  @file       counter_group.hpp
 *
 *  RAII wrapper for grouped Linux perf_event counters.
 *
 *  Provides atomic reading of multiple counters using perf_event groups,
 *  and corrects each value for the fraction of time the kernel actually
 *  scheduled the group on the PMU.
 */

#ifndef PIPA_COLLECTION_COUNTER_GROUP_HPP_
#define PIPA_COLLECTION_COUNTER_GROUP_HPP_

#include "pipa/collection/performance_counter.hpp"
#include "pipa/core/errors.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pipa::collection
{

/**
 *  One counter value from a grouped read, corrected for multiplexing.
 */
struct ScaledValue
{
    /**
     *  The value the kernel reported. Never a final metric on its own.
     */
    std::uint64_t raw;

    std::uint64_t time_enabled;
    std::uint64_t time_running;

    /**
     *  raw * time_enabled / time_running, or std::nullopt if the group
     *  never ran.
     */
    std::optional<double> scaled;

    /**
     *  Checks whether the group was multiplexed out for part of the time.
     */
    [[nodiscard]] constexpr auto wasMultiplexed() const noexcept -> bool
    {
        return time_running < time_enabled;
    }
};

/**
 *  Decoded PERF_FORMAT_GROUP read.
 */
struct GroupSnapshot
{
    struct Entry
    {
        std::uint64_t id;
        std::uint64_t value;
    };

    std::uint64_t time_enabled;
    std::uint64_t time_running;

    /**
     *  Member values in group order, leader first.
     */
    std::vector<Entry> entries;
};

/**
 *  Corrects a raw count for multiplexing.
 *
 *  @param      raw           The raw counter value.
 *  @param      time_enabled  Nanoseconds the counter was enabled.
 *  @param      time_running  Nanoseconds the counter was on the PMU.
 *  @return     The raw value when the counter ran the whole time, the
 *              extrapolated value when it ran part of the time, or
 *              std::nullopt when it never ran.
 */
[[nodiscard]] auto scaleCount(std::uint64_t raw, std::uint64_t time_enabled,
                              std::uint64_t time_running) noexcept -> std::optional<double>;

/**
 *  Decodes the words returned by read() on a group leader opened with
 *  GROUP | TOTAL_TIME_ENABLED | TOTAL_TIME_RUNNING | ID.
 *
 *  Layout: nr, time_enabled, time_running, { value, id } * nr.
 *
 *  @param      words             The words read from the leader.
 *  @param      expected_members  Number of counters in the group.
 *  @return     The snapshot, or PerfError::kReadFailed if the buffer is
 *              short or its member count disagrees.
 */
[[nodiscard]] auto decodeGroupRead(std::span<const std::uint64_t> words,
                                   std::size_t expected_members)
    -> std::expected<GroupSnapshot, core::PerfError>;

/**
 *  Applies scaleCount() to every member of a snapshot.
 *
 *  @param      snapshot  A decoded group read.
 *  @return     Scaled values keyed by kernel event id.
 */
[[nodiscard]] auto scaleSnapshot(const GroupSnapshot& snapshot)
    -> std::map<std::uint64_t, ScaledValue>;

/**
 *  Lifecycle of a CounterGroup.
 */
enum class GroupState : std::uint8_t
{
    kCreated = 0,
    kEnabled = 1,
    kDisabled = 2,
    kClosed = 3,
};

/**
 *  RAII wrapper for a leader counter plus zero or more siblings.
 *
 *  The first configuration becomes the leader and is opened disabled;
 *  siblings join the leader's group. Membership is fixed at creation.
 *  Enabling, disabling and resetting the leader cascades to every member
 *  and one read of the leader returns all values atomically.
 *
 *  This class is move-only; file descriptors cannot be safely copied.
 *
 *  Example usage:
 *  @code
 *      std::array configs{CounterConfig::forEvent(StandardEvent::kCycles),
 *                         CounterConfig::forEvent(StandardEvent::kInstructions)};
 *      auto group = CounterGroup::create(configs);
 *      group->start();
 *      // ... workload runs ...
 *      group->stop();
 *      auto values = group->readAll();
 *  @endcode
 */
class CounterGroup
{
  public:
    /**
     *  Opens all counters of the group.
     *
     *  If any member fails to open, every handle opened so far is closed
     *  and the member's error is returned.
     *
     *  @param      configs  Leader first, then siblings. Must not be empty.
     *  @return     A CounterGroup on success, or PerfError on failure.
     */
    [[nodiscard]] static auto create(std::span<const CounterConfig> configs)
        -> std::expected<CounterGroup, core::PerfError>;

    ~CounterGroup() = default;

    CounterGroup(CounterGroup&& other) noexcept;
    auto operator=(CounterGroup&& other) noexcept -> CounterGroup&;

    // Non-copyable
    CounterGroup(const CounterGroup&) = delete;
    auto operator=(const CounterGroup&) -> CounterGroup& = delete;

    /**
     *  Enables the leader, which cascades to all siblings.
     *
     *  @return     Success, or PerfError::kInvalidState if closed.
     */
    [[nodiscard]] auto start() -> std::expected<void, core::PerfError>;

    /**
     *  Disables the leader. Values are preserved and can still be read.
     *
     *  @return     Success, or PerfError::kInvalidState unless enabled.
     */
    [[nodiscard]] auto stop() -> std::expected<void, core::PerfError>;

    /**
     *  Zeroes every member without closing it.
     *
     *  @return     Success or PerfError on failure.
     */
    [[nodiscard]] auto reset() const -> std::expected<void, core::PerfError>;

    /**
     *  Performs one grouped read and scales every member.
     *
     *  Purely observational.
     *
     *  @return     Scaled values keyed by kernel event id, or PerfError.
     */
    [[nodiscard]] auto readAll() const
        -> std::expected<std::map<std::uint64_t, ScaledValue>, core::PerfError>;

    /**
     *  Releases all handles. Irreversible; closing twice is a no-op.
     */
    void close() noexcept;

    /**
     *  Returns the kernel event ids in group order, leader first.
     */
    [[nodiscard]] auto counterIds() const noexcept -> std::span<const std::uint64_t>;

    /**
     *  Looks up the configured label of a member by kernel event id.
     *
     *  @param      id  A kernel event id from readAll() or counterIds().
     *  @return     The label, or std::nullopt for an unknown id.
     */
    [[nodiscard]] auto labelOf(std::uint64_t id) const -> std::optional<std::string_view>;

    /**
     *  Returns every member label keyed by kernel event id.
     */
    [[nodiscard]] auto labels() const -> std::map<std::uint64_t, std::string>;

    /**
     *  Looks up the kernel event id of a member by label.
     *
     *  @param      label  A configured label.
     *  @return     The first member with that label, or std::nullopt.
     */
    [[nodiscard]] auto idOf(std::string_view label) const -> std::optional<std::uint64_t>;

    /**
     *  Returns the number of counters in the group.
     */
    [[nodiscard]] auto size() const noexcept -> std::size_t;

    [[nodiscard]] auto state() const noexcept -> GroupState;

    /**
     *  Returns the leader's file descriptor, or -1 if closed.
     */
    [[nodiscard]] auto leaderFileDescriptor() const noexcept -> int;

    /**
     *  Checks if every member still owns a valid file descriptor.
     */
    [[nodiscard]] auto isValid() const noexcept -> bool;

  private:
    CounterGroup(std::vector<PerformanceCounter> counters,
                 std::vector<std::uint64_t> ids) noexcept;

    std::vector<PerformanceCounter> counters_;
    std::vector<std::uint64_t> ids_;
    GroupState state_{GroupState::kCreated};
};

}  // namespace pipa::collection

#endif  // PIPA_COLLECTION_COUNTER_GROUP_HPP_
