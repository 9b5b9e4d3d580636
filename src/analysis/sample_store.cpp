/**
 *  @file       sample_store.cpp
 *
 *  Implementation of sample storage and querying.
 */

#include "pipa/analysis/sample_store.hpp"

#include "pipa/collection/ring_buffer_reader.hpp"
#include "pipa/core/records.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <span>
#include <utility>
#include <vector>

namespace pipa::analysis
{

namespace
{

/**
 *  Sort key: the timestamp, with untimed samples after every timed one.
 */
auto timeKey(const core::SampleRecord& sample) noexcept -> std::uint64_t
{
    return sample.time.value_or(std::numeric_limits<std::uint64_t>::max());
}

}  // namespace

void SampleStore::add(core::SampleRecord sample)
{
    // upper_bound keeps insertion order among equal timestamps. Samples
    // usually arrive in order, so this is an append in the common case.
    auto insertion_point = std::ranges::upper_bound(samples_, timeKey(sample), {}, timeKey);

    samples_.insert(insertion_point, std::move(sample));
}

void SampleStore::add(const collection::PollBatch& batch)
{
    samples_.reserve(samples_.size() + batch.samples.size());
    for (const auto& sample : batch.samples)
    {
        add(sample);
    }
    addLost(batch.lost);
}

void SampleStore::addLost(std::uint64_t count) noexcept
{
    lost_ += count;
}

auto SampleStore::all() const noexcept -> std::span<const core::SampleRecord>
{
    return samples_;
}

auto SampleStore::forThread(std::uint32_t tid) const -> std::vector<core::SampleRecord>
{
    std::vector<core::SampleRecord> result;

    // Linear scan to filter by thread ID
    for (const auto& sample : samples_)
    {
        if (sample.tid == tid)
        {
            result.push_back(sample);
        }
    }

    return result;
}

auto SampleStore::inRange(std::uint64_t start_ns, std::uint64_t end_ns) const
    -> std::vector<core::SampleRecord>
{
    std::vector<core::SampleRecord> result;

    // Binary search to the first sample at or after start_ns
    auto range_start = std::ranges::lower_bound(samples_, start_ns, {}, timeKey);

    for (auto it = range_start; it != samples_.end(); ++it)
    {
        // Untimed samples sort last and are never in range
        if (!it->time || *it->time > end_ns)
        {
            break;
        }
        result.push_back(*it);
    }

    return result;
}

auto SampleStore::countsByThread() const -> std::map<std::uint32_t, std::size_t>
{
    std::map<std::uint32_t, std::size_t> counts;
    for (const auto& sample : samples_)
    {
        if (sample.tid)
        {
            ++counts[*sample.tid];
        }
    }
    return counts;
}

auto SampleStore::size() const noexcept -> std::size_t
{
    return samples_.size();
}

auto SampleStore::lostCount() const noexcept -> std::uint64_t
{
    return lost_;
}

void SampleStore::clear() noexcept
{
    samples_.clear();
    lost_ = 0;
}

}  // namespace pipa::analysis
