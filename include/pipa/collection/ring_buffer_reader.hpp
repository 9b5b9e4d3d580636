/**
 *  @file       ring_buffer_reader.hpp
 *
 *  Lock-free consumer of the perf sampling ring buffer.
 *
 *  The kernel appends records and advances data_head; the reader consumes
 *  records and advances data_tail. The two synchronize only through an
 *  acquire load of data_head and a release store of data_tail.
 */

#ifndef PIPA_COLLECTION_RING_BUFFER_READER_HPP_
#define PIPA_COLLECTION_RING_BUFFER_READER_HPP_

#include "pipa/collection/mapped_region.hpp"
#include "pipa/core/errors.hpp"
#include "pipa/core/records.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <limits>
#include <optional>
#include <span>
#include <vector>

struct perf_event_mmap_page;

namespace pipa::collection
{

/**
 *  Records collected by one poll.
 */
struct PollBatch
{
    /**
     *  Decoded samples in buffer order.
     */
    std::vector<core::SampleRecord> samples;

    /**
     *  Lost, lost-samples and throttle records, in buffer order.
     */
    std::vector<core::Record> events;

    /**
     *  Records the kernel reported as dropped during this poll.
     */
    std::uint64_t lost{0};

    /**
     *  Set when the poll stopped at a record the kernel has not finished.
     */
    bool incomplete{false};
};

/**
 *  Running totals kept by a reader.
 */
struct ReaderStats
{
    std::uint64_t records_read{0};
    std::uint64_t samples{0};

    /**
     *  Sum of all kernel-reported lost counts.
     */
    std::uint64_t lost{0};

    /**
     *  Records that failed to decode, plus tail resynchronizations.
     */
    std::uint64_t corrupt{0};

    /**
     *  Records of kinds the reader does not surface.
     */
    std::uint64_t skipped{0};
};

/**
 *  Reads records out of a perf ring buffer.
 *
 *  A reader either owns the mapping of a sampling counter or is attached
 *  to caller-provided memory with the same layout. Reading is organized
 *  in polls: beginPoll() snapshots data_head, and next() then yields the
 *  records up to that snapshot one at a time. Each consumed record is
 *  released to the kernel immediately.
 *
 *  Not thread-safe. Exactly one reader may consume a given buffer.
 *
 *  Example usage:
 *  @code
 *      auto reader = RingBufferReader::map(counter.fileDescriptor(), 8, layout);
 *      reader->beginPoll();
 *      while (auto record = reader->next()) {
 *          // ... handle *record ...
 *      }
 *  @endcode
 */
class RingBufferReader
{
  public:
    static constexpr std::size_t kUnbounded = std::numeric_limits<std::size_t>::max();

    /**
     *  Maps the ring buffer of a sampling counter.
     *
     *  @param      fd          The counter's file descriptor.
     *  @param      data_pages  Power of two number of data pages.
     *  @param      layout      The counter's sample layout.
     *  @return     A reader, or PerfError on failure.
     */
    [[nodiscard]] static auto map(int fd, std::size_t data_pages, const core::SampleLayout& layout)
        -> std::expected<RingBufferReader, core::PerfError>;

    /**
     *  Attaches to memory laid out like a perf mapping: a control page
     *  followed by a power of two number of data bytes.
     *
     *  The memory must outlive the reader and be 8-byte aligned.
     *
     *  @param      region     The whole region, control page first.
     *  @param      page_size  Size of the control page.
     *  @param      layout     The sample layout of the records.
     *  @return     A reader, or PerfError::kInvalidConfig for a bad region.
     */
    [[nodiscard]] static auto attach(std::span<std::byte> region, std::size_t page_size,
                                     const core::SampleLayout& layout)
        -> std::expected<RingBufferReader, core::PerfError>;

    ~RingBufferReader() = default;

    RingBufferReader(RingBufferReader&& other) noexcept;
    auto operator=(RingBufferReader&& other) noexcept -> RingBufferReader&;

    // Non-copyable
    RingBufferReader(const RingBufferReader&) = delete;
    auto operator=(const RingBufferReader&) -> RingBufferReader& = delete;

    /**
     *  Snapshots data_head with acquire ordering and starts a new poll.
     */
    void beginPoll() noexcept;

    /**
     *  Yields the next record of the current poll.
     *
     *  Samples that fail to decode and records of other kinds are counted
     *  and skipped. Returns std::nullopt when the snapshot is exhausted or
     *  the next record is incomplete.
     *
     *  @return     The next record, or std::nullopt.
     */
    [[nodiscard]] auto next() -> std::optional<core::Record>;

    /**
     *  Runs one poll and collects its records.
     *
     *  @param      max_records  Stop after this many records; the rest stay
     *                           in the buffer for the next poll.
     *  @return     The batch of this poll.
     */
    [[nodiscard]] auto poll(std::size_t max_records = kUnbounded) -> PollBatch;

    /**
     *  Checks whether the kernel has written data not yet consumed.
     */
    [[nodiscard]] auto hasUnread() const noexcept -> bool;

    /**
     *  Returns the number of records the kernel reported as lost.
     */
    [[nodiscard]] auto lostCount() const noexcept -> std::uint64_t;

    [[nodiscard]] auto stats() const noexcept -> const ReaderStats&;

    /**
     *  Returns the size of the data area in bytes.
     */
    [[nodiscard]] auto dataSize() const noexcept -> std::size_t;

    [[nodiscard]] auto layout() const noexcept -> const core::SampleLayout&;

  private:
    RingBufferReader(std::optional<MappedRegion> region, perf_event_mmap_page* control,
                     std::byte* data, std::size_t data_size,
                     const core::SampleLayout& layout) noexcept;

    [[nodiscard]] static auto fromRegion(std::optional<MappedRegion> owned,
                                         std::span<std::byte> region, std::size_t page_size,
                                         const core::SampleLayout& layout)
        -> std::expected<RingBufferReader, core::PerfError>;

    /**
     *  Copies bytes starting at a ring position, joining the two halves of
     *  a range that crosses the physical end of the data area.
     */
    void copyOut(std::uint64_t position, std::span<std::byte> out) const noexcept;

    [[nodiscard]] auto loadTail() const noexcept -> std::uint64_t;
    void storeTail(std::uint64_t tail) noexcept;

    /**
     *  Turns the record in scratch_ into a surfaced record, or std::nullopt
     *  if it is skipped.
     */
    auto interpret(std::uint32_t type, std::uint16_t misc) -> std::optional<core::Record>;

    std::optional<MappedRegion> region_;
    perf_event_mmap_page* control_;
    std::byte* data_;
    std::size_t data_size_;
    core::SampleLayout layout_;

    std::uint64_t head_snapshot_{0};
    bool incomplete_{false};
    std::vector<std::byte> scratch_;
    ReaderStats stats_;
};

}  // namespace pipa::collection

#endif  // PIPA_COLLECTION_RING_BUFFER_READER_HPP_
