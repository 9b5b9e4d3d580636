/**
 *  @file       sample_store.hpp
 *
 *  Storage and querying of decoded samples for one run.
 *
 *  Keeps samples ordered by timestamp and supports per-thread and
 *  time-range queries, plus the lost-record count of the run.
 */

#ifndef PIPA_ANALYSIS_SAMPLE_STORE_HPP_
#define PIPA_ANALYSIS_SAMPLE_STORE_HPP_

#include "pipa/collection/ring_buffer_reader.hpp"
#include "pipa/core/records.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <span>
#include <vector>

namespace pipa::analysis
{

/**
 *  Stores the samples of one run for analysis.
 *
 *  Samples are kept sorted by timestamp; samples with equal timestamps
 *  keep their insertion order, and samples without a timestamp sort last.
 *
 *  Thread-safety: This class is NOT thread-safe. External synchronization
 *  is required if accessed from multiple threads.
 */
class SampleStore
{
  public:
    SampleStore() = default;

    /**
     *  Adds one sample.
     *
     *  @param      sample  The sample to store.
     */
    void add(core::SampleRecord sample);

    /**
     *  Adds every sample of a batch and its lost count.
     *
     *  @param      batch  A batch from a poll or drain.
     */
    void add(const collection::PollBatch& batch);

    /**
     *  Records samples the kernel dropped.
     *
     *  @param      count  Number of lost records.
     */
    void addLost(std::uint64_t count) noexcept;

    /**
     *  Returns a view of all stored samples in timestamp order.
     */
    [[nodiscard]] auto all() const noexcept -> std::span<const core::SampleRecord>;

    /**
     *  Returns all samples taken on a specific thread.
     *
     *  @param      tid  The thread ID to filter by.
     *  @return     A vector of samples for the specified thread.
     */
    [[nodiscard]] auto forThread(std::uint32_t tid) const -> std::vector<core::SampleRecord>;

    /**
     *  Returns all samples within a time range.
     *
     *  @param      start_ns  Start of time range (inclusive).
     *  @param      end_ns    End of time range (inclusive).
     *  @return     A vector of samples within the specified range.
     */
    [[nodiscard]] auto inRange(std::uint64_t start_ns, std::uint64_t end_ns) const
        -> std::vector<core::SampleRecord>;

    /**
     *  Counts samples per thread. Samples without a tid are not counted.
     */
    [[nodiscard]] auto countsByThread() const -> std::map<std::uint32_t, std::size_t>;

    [[nodiscard]] auto size() const noexcept -> std::size_t;

    [[nodiscard]] auto lostCount() const noexcept -> std::uint64_t;

    /**
     *  Removes all samples and resets the lost count.
     */
    void clear() noexcept;

  private:
    std::vector<core::SampleRecord> samples_;
    std::uint64_t lost_{0};
};

}  // namespace pipa::analysis

#endif  // PIPA_ANALYSIS_SAMPLE_STORE_HPP_
