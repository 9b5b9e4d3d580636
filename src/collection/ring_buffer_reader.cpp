/**
 *  @file       ring_buffer_reader.cpp
 *
 *  Implementation of the perf ring buffer consumer.
 */

#include "pipa/collection/ring_buffer_reader.hpp"

#include "pipa/collection/mapped_region.hpp"
#include "pipa/collection/sample_decoder.hpp"
#include "pipa/core/errors.hpp"
#include "pipa/core/logging.hpp"
#include "pipa/core/records.hpp"

#include <algorithm>
#include <atomic>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <expected>
#include <linux/perf_event.h>
#include <optional>
#include <span>
#include <utility>
#include <variant>
#include <vector>

namespace pipa::collection
{

namespace
{

constexpr std::size_t kHeaderSize = sizeof(perf_event_header);

// Records are padded to u64 multiples
constexpr std::size_t kRecordAlignment = sizeof(std::uint64_t);

/**
 *  Reads a u64 at a byte offset of a record body.
 */
auto wordAt(std::span<const std::byte> bytes, std::size_t offset) noexcept -> std::uint64_t
{
    std::uint64_t value = 0;
    std::memcpy(&value, bytes.data() + offset, sizeof(value));
    return value;
}

}  // namespace

RingBufferReader::RingBufferReader(std::optional<MappedRegion> region,
                                   perf_event_mmap_page* control, std::byte* data,
                                   std::size_t data_size, const core::SampleLayout& layout) noexcept
    : region_(std::move(region)),
      control_(control),
      data_(data),
      data_size_(data_size),
      layout_(layout)
{
    // Nothing is readable until the first beginPoll()
    head_snapshot_ = loadTail();
}

RingBufferReader::RingBufferReader(RingBufferReader&& other) noexcept
    : region_(std::move(other.region_)),
      control_(std::exchange(other.control_, nullptr)),
      data_(std::exchange(other.data_, nullptr)),
      data_size_(std::exchange(other.data_size_, 0)),
      layout_(other.layout_),
      head_snapshot_(std::exchange(other.head_snapshot_, 0)),
      incomplete_(std::exchange(other.incomplete_, false)),
      scratch_(std::move(other.scratch_)),
      stats_(std::exchange(other.stats_, ReaderStats{}))
{
    other.region_.reset();
}

auto RingBufferReader::operator=(RingBufferReader&& other) noexcept -> RingBufferReader&
{
    if (this != &other)
    {
        region_ = std::move(other.region_);
        other.region_.reset();
        control_ = std::exchange(other.control_, nullptr);
        data_ = std::exchange(other.data_, nullptr);
        data_size_ = std::exchange(other.data_size_, 0);
        layout_ = other.layout_;
        head_snapshot_ = std::exchange(other.head_snapshot_, 0);
        incomplete_ = std::exchange(other.incomplete_, false);
        scratch_ = std::move(other.scratch_);
        stats_ = std::exchange(other.stats_, ReaderStats{});
    }
    return *this;
}

auto RingBufferReader::map(int fd, std::size_t data_pages, const core::SampleLayout& layout)
    -> std::expected<RingBufferReader, core::PerfError>
{
    auto valid = core::validateLayout(layout);
    if (!valid)
    {
        return std::unexpected(valid.error());
    }

    auto region = MappedRegion::map(fd, data_pages);
    if (!region)
    {
        return std::unexpected(region.error());
    }

    auto bytes = region->bytes();
    return fromRegion(std::move(*region), bytes, MappedRegion::pageSize(), layout);
}

auto RingBufferReader::attach(std::span<std::byte> region, std::size_t page_size,
                              const core::SampleLayout& layout)
    -> std::expected<RingBufferReader, core::PerfError>
{
    auto valid = core::validateLayout(layout);
    if (!valid)
    {
        return std::unexpected(valid.error());
    }

    return fromRegion(std::nullopt, region, page_size, layout);
}

auto RingBufferReader::fromRegion(std::optional<MappedRegion> owned, std::span<std::byte> region,
                                  std::size_t page_size, const core::SampleLayout& layout)
    -> std::expected<RingBufferReader, core::PerfError>
{
    if (page_size < sizeof(perf_event_mmap_page) || region.size() <= page_size ||
        reinterpret_cast<std::uintptr_t>(region.data()) % alignof(perf_event_mmap_page) != 0)
    {
        return std::unexpected(core::PerfError::kInvalidConfig);
    }

    auto* control = reinterpret_cast<perf_event_mmap_page*>(region.data());

    // Kernels since 4.1 describe the data area in the control page; older
    // ones and synthetic buffers leave it zero and start it at page two.
    std::size_t data_offset = page_size;
    std::size_t data_size = region.size() - page_size;
    if (control->data_size != 0)
    {
        if (control->data_offset < page_size ||
            control->data_offset + control->data_size > region.size())
        {
            PIPA_LOG_ERROR("control page describes data area [{}, +{}) outside a {} byte mapping",
                           control->data_offset, control->data_size, region.size());
            return std::unexpected(core::PerfError::kMappingFailed);
        }
        data_offset = static_cast<std::size_t>(control->data_offset);
        data_size = static_cast<std::size_t>(control->data_size);
    }

    // Ring positions are reduced with a mask
    if (!std::has_single_bit(data_size))
    {
        return std::unexpected(core::PerfError::kInvalidConfig);
    }

    return RingBufferReader{std::move(owned), control, region.data() + data_offset, data_size,
                            layout};
}

auto RingBufferReader::loadTail() const noexcept -> std::uint64_t
{
    // Only this reader writes data_tail
    return std::atomic_ref<__u64>{control_->data_tail}.load(std::memory_order_relaxed);
}

void RingBufferReader::storeTail(std::uint64_t tail) noexcept
{
    // Release: our reads of the record happen before the kernel may reuse it
    std::atomic_ref<__u64>{control_->data_tail}.store(tail, std::memory_order_release);
}

void RingBufferReader::beginPoll() noexcept
{
    if (control_ == nullptr)
    {
        return;
    }

    // Acquire: every record byte written before head moved is visible
    head_snapshot_ = std::atomic_ref<__u64>{control_->data_head}.load(std::memory_order_acquire);
    incomplete_ = false;
}

void RingBufferReader::copyOut(std::uint64_t position, std::span<std::byte> out) const noexcept
{
    auto offset = static_cast<std::size_t>(position & (data_size_ - 1));
    std::size_t first = std::min(out.size(), data_size_ - offset);

    std::memcpy(out.data(), data_ + offset, first);
    if (first < out.size())
    {
        // Remainder wrapped to the start of the data area
        std::memcpy(out.data() + first, data_, out.size() - first);
    }
}

auto RingBufferReader::next() -> std::optional<core::Record>
{
    if (control_ == nullptr)
    {
        return std::nullopt;
    }

    while (true)
    {
        std::uint64_t tail = loadTail();
        if (tail == head_snapshot_ || incomplete_)
        {
            return std::nullopt;
        }

        std::uint64_t available = head_snapshot_ - tail;
        if (available > data_size_)
        {
            // The kernel never lets head run a full buffer ahead of tail
            PIPA_LOG_WARNING("ring buffer tail {} is {} bytes behind head; resynchronizing", tail,
                             available);
            ++stats_.corrupt;
            storeTail(head_snapshot_);
            return std::nullopt;
        }

        if (available < kHeaderSize)
        {
            incomplete_ = true;
            return std::nullopt;
        }

        perf_event_header header{};
        copyOut(tail, {reinterpret_cast<std::byte*>(&header), kHeaderSize});

        if (header.size < kHeaderSize || header.size % kRecordAlignment != 0)
        {
            // No way to find the next record boundary
            PIPA_LOG_WARNING("corrupt record header (type {}, size {}); resynchronizing",
                             header.type, header.size);
            ++stats_.corrupt;
            storeTail(head_snapshot_);
            return std::nullopt;
        }

        if (header.size > available)
        {
            // Retry on the next poll
            incomplete_ = true;
            return std::nullopt;
        }

        scratch_.resize(header.size - kHeaderSize);
        copyOut(tail + kHeaderSize, scratch_);

        // The record is copied out; hand its space back to the kernel
        storeTail(tail + header.size);
        ++stats_.records_read;

        auto record = interpret(header.type, header.misc);
        if (record)
        {
            return record;
        }
    }
}

auto RingBufferReader::interpret(std::uint32_t type, std::uint16_t misc)
    -> std::optional<core::Record>
{
    std::span<const std::byte> body{scratch_};

    switch (type)
    {
        case PERF_RECORD_SAMPLE: {
            auto sample = decodeSample(body, layout_, misc);
            if (!sample)
            {
                ++stats_.corrupt;
                return std::nullopt;
            }
            ++stats_.samples;
            return core::Record{std::move(*sample)};
        }

        case PERF_RECORD_LOST: {
            // id, lost
            if (body.size() < 2 * sizeof(std::uint64_t))
            {
                ++stats_.corrupt;
                return std::nullopt;
            }
            core::LostRecord lost{.id = wordAt(body, 0), .lost = wordAt(body, 8)};
            stats_.lost += lost.lost;
            PIPA_LOG_DEBUG("kernel dropped {} records", lost.lost);
            return core::Record{lost};
        }

        case PERF_RECORD_LOST_SAMPLES: {
            if (body.size() < sizeof(std::uint64_t))
            {
                ++stats_.corrupt;
                return std::nullopt;
            }
            core::LostSamplesRecord lost{.lost = wordAt(body, 0)};
            stats_.lost += lost.lost;
            return core::Record{lost};
        }

        case PERF_RECORD_THROTTLE:
        case PERF_RECORD_UNTHROTTLE: {
            // time, id, stream_id
            if (body.size() < 3 * sizeof(std::uint64_t))
            {
                ++stats_.corrupt;
                return std::nullopt;
            }
            return core::Record{core::ThrottleRecord{
                .time = wordAt(body, 0),
                .id = wordAt(body, 8),
                .stream_id = wordAt(body, 16),
                .throttled = type == PERF_RECORD_THROTTLE,
            }};
        }

        default:
            ++stats_.skipped;
            return std::nullopt;
    }
}

auto RingBufferReader::poll(std::size_t max_records) -> PollBatch
{
    PollBatch batch;
    beginPoll();

    std::size_t count = 0;
    while (count < max_records)
    {
        auto record = next();
        if (!record)
        {
            break;
        }
        ++count;

        if (auto* sample = std::get_if<core::SampleRecord>(&*record))
        {
            batch.samples.push_back(std::move(*sample));
            continue;
        }
        if (const auto* lost = std::get_if<core::LostRecord>(&*record))
        {
            batch.lost += lost->lost;
        }
        else if (const auto* lost_samples = std::get_if<core::LostSamplesRecord>(&*record))
        {
            batch.lost += lost_samples->lost;
        }
        batch.events.push_back(std::move(*record));
    }

    batch.incomplete = incomplete_;
    return batch;
}

auto RingBufferReader::hasUnread() const noexcept -> bool
{
    if (control_ == nullptr)
    {
        return false;
    }
    auto head = std::atomic_ref<__u64>{control_->data_head}.load(std::memory_order_acquire);
    return head != loadTail();
}

auto RingBufferReader::lostCount() const noexcept -> std::uint64_t
{
    return stats_.lost;
}

auto RingBufferReader::stats() const noexcept -> const ReaderStats&
{
    return stats_;
}

auto RingBufferReader::dataSize() const noexcept -> std::size_t
{
    return data_size_;
}

auto RingBufferReader::layout() const noexcept -> const core::SampleLayout&
{
    return layout_;
}

}  // namespace pipa::collection
