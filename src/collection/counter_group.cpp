/**
 *  @file       counter_group.cpp
 *
 *  Implementation of the CounterGroup class using Linux perf_event groups.
 */

#include "pipa/collection/counter_group.hpp"

#include "pipa/collection/performance_counter.hpp"
#include "pipa/core/errors.hpp"
#include "pipa/core/logging.hpp"
#include "pipa/core/records.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <iterator>
#include <linux/perf_event.h>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <sys/ioctl.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace pipa::collection
{

namespace
{

// nr, time_enabled, time_running
constexpr std::size_t kGroupHeaderWords = 3;

// value, id
constexpr std::size_t kWordsPerMember = 2;

/**
 *  Issues a group-wide ioctl on the leader.
 */
auto leaderIoctl(int leader_fd, unsigned long request) -> std::expected<void, core::PerfError>
{
    // FLAG_GROUP applies the request to every member atomically
    if (ioctl(leader_fd, request, PERF_IOC_FLAG_GROUP) < 0)
    {
        return std::unexpected(core::PerfError::kInvalidState);
    }
    return {};
}

}  // namespace

auto scaleCount(std::uint64_t raw, std::uint64_t time_enabled, std::uint64_t time_running) noexcept
    -> std::optional<double>
{
    // Never scheduled: there is no basis for an estimate
    if (time_running == 0)
    {
        return std::nullopt;
    }

    if (time_running >= time_enabled)
    {
        return static_cast<double>(raw);
    }

    return static_cast<double>(raw) * static_cast<double>(time_enabled) /
           static_cast<double>(time_running);
}

auto decodeGroupRead(std::span<const std::uint64_t> words, std::size_t expected_members)
    -> std::expected<GroupSnapshot, core::PerfError>
{
    if (words.size() < kGroupHeaderWords)
    {
        return std::unexpected(core::PerfError::kReadFailed);
    }

    const std::uint64_t nr = words[0];
    if (nr != expected_members)
    {
        return std::unexpected(core::PerfError::kReadFailed);
    }

    if (words.size() < kGroupHeaderWords + (nr * kWordsPerMember))
    {
        return std::unexpected(core::PerfError::kReadFailed);
    }

    GroupSnapshot snapshot{
        .time_enabled = words[1],
        .time_running = words[2],
        .entries = {},
    };
    snapshot.entries.reserve(nr);

    for (std::size_t i = 0; i < nr; ++i)
    {
        auto base = kGroupHeaderWords + (i * kWordsPerMember);
        snapshot.entries.push_back(GroupSnapshot::Entry{
            .id = words[base + 1],
            .value = words[base],
        });
    }

    return snapshot;
}

auto scaleSnapshot(const GroupSnapshot& snapshot) -> std::map<std::uint64_t, ScaledValue>
{
    std::map<std::uint64_t, ScaledValue> result;

    // All members of a group are scheduled together and share the times
    for (const auto& entry : snapshot.entries)
    {
        result.emplace(entry.id,
                       ScaledValue{
                           .raw = entry.value,
                           .time_enabled = snapshot.time_enabled,
                           .time_running = snapshot.time_running,
                           .scaled = scaleCount(entry.value, snapshot.time_enabled,
                                                snapshot.time_running),
                       });
    }

    return result;
}

CounterGroup::CounterGroup(std::vector<PerformanceCounter> counters,
                           std::vector<std::uint64_t> ids) noexcept
    : counters_(std::move(counters)), ids_(std::move(ids))
{
}

CounterGroup::CounterGroup(CounterGroup&& other) noexcept
    : counters_(std::move(other.counters_)),
      ids_(std::move(other.ids_)),
      state_(std::exchange(other.state_, GroupState::kClosed))
{
    other.counters_.clear();
    other.ids_.clear();
}

auto CounterGroup::operator=(CounterGroup&& other) noexcept -> CounterGroup&
{
    if (this != &other)
    {
        // Release our current resources first
        close();

        counters_ = std::move(other.counters_);
        ids_ = std::move(other.ids_);
        state_ = std::exchange(other.state_, GroupState::kClosed);

        other.counters_.clear();
        other.ids_.clear();
    }
    return *this;
}

auto CounterGroup::create(std::span<const CounterConfig> configs)
    -> std::expected<CounterGroup, core::PerfError>
{
    if (configs.empty())
    {
        return std::unexpected(core::PerfError::kInvalidConfig);
    }

    std::vector<PerformanceCounter> counters;
    std::vector<std::uint64_t> ids;
    counters.reserve(configs.size());
    ids.reserve(configs.size());

    // Leader needs GROUP format for atomic multi-counter reads
    CounterConfig leader_config = configs.front();
    leader_config.read_format |= core::kFormatGroup | core::kFormatId |
                                 core::kFormatTotalTimeEnabled | core::kFormatTotalTimeRunning;

    auto leader = PerformanceCounter::open(leader_config);
    if (!leader)
    {
        return std::unexpected(leader.error());
    }
    int leader_fd = leader->fileDescriptor();
    counters.push_back(std::move(*leader));

    // Members join the group via leader_fd. On failure, the counters
    // already in the vector close their descriptors as it is destroyed.
    for (const auto& config : configs.subspan(1))
    {
        auto member = PerformanceCounter::open(config, leader_fd);
        if (!member)
        {
            PIPA_LOG_DEBUG("group member '{}' failed to open: {}", config.label,
                           core::toString(member.error()));
            return std::unexpected(member.error());
        }
        counters.push_back(std::move(*member));
    }

    for (const auto& counter : counters)
    {
        auto event_id = counter.id();
        if (!event_id)
        {
            return std::unexpected(event_id.error());
        }
        ids.push_back(*event_id);
    }

    return CounterGroup{std::move(counters), std::move(ids)};
}

auto CounterGroup::start() -> std::expected<void, core::PerfError>
{
    if (state_ == GroupState::kClosed || !isValid())
    {
        return std::unexpected(core::PerfError::kInvalidState);
    }

    auto result = leaderIoctl(leaderFileDescriptor(), PERF_EVENT_IOC_ENABLE);
    if (result)
    {
        state_ = GroupState::kEnabled;
    }
    return result;
}

auto CounterGroup::stop() -> std::expected<void, core::PerfError>
{
    if (state_ != GroupState::kEnabled || !isValid())
    {
        return std::unexpected(core::PerfError::kInvalidState);
    }

    auto result = leaderIoctl(leaderFileDescriptor(), PERF_EVENT_IOC_DISABLE);
    if (result)
    {
        state_ = GroupState::kDisabled;
    }
    return result;
}

auto CounterGroup::reset() const -> std::expected<void, core::PerfError>
{
    if (state_ == GroupState::kClosed || !isValid())
    {
        return std::unexpected(core::PerfError::kInvalidState);
    }

    return leaderIoctl(leaderFileDescriptor(), PERF_EVENT_IOC_RESET);
}

auto CounterGroup::readAll() const
    -> std::expected<std::map<std::uint64_t, ScaledValue>, core::PerfError>
{
    if (state_ == GroupState::kClosed || !isValid())
    {
        return std::unexpected(core::PerfError::kInvalidState);
    }

    std::vector<std::uint64_t> words(kGroupHeaderWords + (counters_.size() * kWordsPerMember));

    // Read from leader gets all values atomically
    ssize_t bytes_read =
        ::read(leaderFileDescriptor(), words.data(), words.size() * sizeof(std::uint64_t));
    if (bytes_read < 0)
    {
        return std::unexpected(core::PerfError::kReadFailed);
    }

    words.resize(static_cast<std::size_t>(bytes_read) / sizeof(std::uint64_t));

    auto snapshot = decodeGroupRead(words, counters_.size());
    if (!snapshot)
    {
        return std::unexpected(snapshot.error());
    }

    if (snapshot->time_running < snapshot->time_enabled)
    {
        PIPA_LOG_TRACE("group multiplexed: enabled={}ns running={}ns", snapshot->time_enabled,
                       snapshot->time_running);
    }

    return scaleSnapshot(*snapshot);
}

void CounterGroup::close() noexcept
{
    // Siblings first, leader last
    for (auto it = counters_.rbegin(); it != counters_.rend(); ++it)
    {
        it->close();
    }
    state_ = GroupState::kClosed;
}

auto CounterGroup::counterIds() const noexcept -> std::span<const std::uint64_t>
{
    return ids_;
}

auto CounterGroup::labelOf(std::uint64_t id) const -> std::optional<std::string_view>
{
    auto it = std::ranges::find(ids_, id);
    if (it == ids_.end())
    {
        return std::nullopt;
    }
    auto index = static_cast<std::size_t>(std::distance(ids_.begin(), it));
    return std::string_view{counters_[index].config().label};
}

auto CounterGroup::labels() const -> std::map<std::uint64_t, std::string>
{
    std::map<std::uint64_t, std::string> result;
    for (std::size_t i = 0; i < counters_.size() && i < ids_.size(); ++i)
    {
        result.emplace(ids_[i], counters_[i].config().label);
    }
    return result;
}

auto CounterGroup::idOf(std::string_view label) const -> std::optional<std::uint64_t>
{
    for (std::size_t i = 0; i < counters_.size() && i < ids_.size(); ++i)
    {
        if (counters_[i].config().label == label)
        {
            return ids_[i];
        }
    }
    return std::nullopt;
}

auto CounterGroup::size() const noexcept -> std::size_t
{
    return counters_.size();
}

auto CounterGroup::state() const noexcept -> GroupState
{
    return state_;
}

auto CounterGroup::leaderFileDescriptor() const noexcept -> int
{
    if (counters_.empty())
    {
        return -1;
    }
    return counters_.front().fileDescriptor();
}

auto CounterGroup::isValid() const noexcept -> bool
{
    // Valid only if ALL file descriptors are valid
    return !counters_.empty() && std::ranges::all_of(counters_,
                                                     [](const PerformanceCounter& counter)
                                                     {
                                                         return counter.isValid();
                                                     });
}

}  // namespace pipa::collection
