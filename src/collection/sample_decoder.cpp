/**
 *  @file       sample_decoder.cpp
 *
 *  Implementation of canonical-order sample payload decoding.
 */

#include "pipa/collection/sample_decoder.hpp"

#include "pipa/core/errors.hpp"
#include "pipa/core/logging.hpp"
#include "pipa/core/records.hpp"

#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <expected>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace pipa::collection
{

namespace
{

/**
 *  Bounds-checked forward reader over a record payload.
 *
 *  Ring buffer records are only guaranteed 8-byte aligned relative to the
 *  buffer start, so every read goes through memcpy.
 */
class ByteCursor
{
  public:
    explicit ByteCursor(std::span<const std::byte> bytes) noexcept : bytes_(bytes) {}

    template <typename T>
    auto read() noexcept -> std::optional<T>
    {
        if (remaining() < sizeof(T))
        {
            return std::nullopt;
        }
        T value{};
        std::memcpy(&value, bytes_.data() + offset_, sizeof(T));
        offset_ += sizeof(T);
        return value;
    }

    auto readBytes(std::size_t count) -> std::optional<std::vector<std::byte>>
    {
        if (remaining() < count)
        {
            return std::nullopt;
        }
        auto first = bytes_.begin() + static_cast<std::ptrdiff_t>(offset_);
        std::vector<std::byte> out(first, first + static_cast<std::ptrdiff_t>(count));
        offset_ += count;
        return out;
    }

    [[nodiscard]] auto remaining() const noexcept -> std::size_t
    {
        return bytes_.size() - offset_;
    }

    [[nodiscard]] auto consumed() const noexcept -> std::size_t
    {
        return offset_;
    }

  private:
    std::span<const std::byte> bytes_;
    std::size_t offset_{0};
};

auto isSet(std::uint64_t mask, std::uint64_t bit) noexcept -> bool
{
    return (mask & bit) != 0;
}

/**
 *  Reads a u64 field into the target if its bit is selected.
 *
 *  @return     False if the bit is selected but the payload is too short.
 */
auto readField(ByteCursor& cursor, std::uint64_t sample_type, std::uint64_t bit,
               std::optional<std::uint64_t>& target) noexcept -> bool
{
    if (!isSet(sample_type, bit))
    {
        return true;
    }
    target = cursor.read<std::uint64_t>();
    return target.has_value();
}

/**
 *  Decodes the read_format structure embedded by kSampleRead.
 */
auto readValues(ByteCursor& cursor, std::uint64_t read_format) -> std::optional<core::ReadValues>
{
    core::ReadValues values;
    bool has_id = isSet(read_format, core::kFormatId);

    if (isSet(read_format, core::kFormatGroup))
    {
        // nr, [enabled], [running], { value, [id] } * nr
        auto nr = cursor.read<std::uint64_t>();
        if (!nr)
        {
            return std::nullopt;
        }
        if (isSet(read_format, core::kFormatTotalTimeEnabled))
        {
            values.time_enabled = cursor.read<std::uint64_t>();
            if (!values.time_enabled)
            {
                return std::nullopt;
            }
        }
        if (isSet(read_format, core::kFormatTotalTimeRunning))
        {
            values.time_running = cursor.read<std::uint64_t>();
            if (!values.time_running)
            {
                return std::nullopt;
            }
        }

        // Guard against a corrupt count before reserving
        std::size_t entry_size = sizeof(std::uint64_t) * (has_id ? 2 : 1);
        if (*nr > cursor.remaining() / entry_size)
        {
            return std::nullopt;
        }

        values.values.reserve(*nr);
        for (std::uint64_t i = 0; i < *nr; ++i)
        {
            core::ReadValue entry{};
            auto value = cursor.read<std::uint64_t>();
            if (!value)
            {
                return std::nullopt;
            }
            entry.value = *value;
            if (has_id)
            {
                entry.id = cursor.read<std::uint64_t>();
                if (!entry.id)
                {
                    return std::nullopt;
                }
            }
            values.values.push_back(entry);
        }
        return values;
    }

    // value, [enabled], [running], [id]
    core::ReadValue entry{};
    auto value = cursor.read<std::uint64_t>();
    if (!value)
    {
        return std::nullopt;
    }
    entry.value = *value;
    if (isSet(read_format, core::kFormatTotalTimeEnabled))
    {
        values.time_enabled = cursor.read<std::uint64_t>();
        if (!values.time_enabled)
        {
            return std::nullopt;
        }
    }
    if (isSet(read_format, core::kFormatTotalTimeRunning))
    {
        values.time_running = cursor.read<std::uint64_t>();
        if (!values.time_running)
        {
            return std::nullopt;
        }
    }
    if (has_id)
    {
        entry.id = cursor.read<std::uint64_t>();
        if (!entry.id)
        {
            return std::nullopt;
        }
    }
    values.values.push_back(entry);
    return values;
}

/**
 *  Walks the canonical field order. Returns nullopt on any short read.
 */
auto decodeFields(ByteCursor& cursor, const core::SampleLayout& layout, std::uint16_t misc)
    -> std::optional<core::SampleRecord>
{
    const std::uint64_t type = layout.sample_type;
    core::SampleRecord sample;
    sample.misc = misc;

    if (!readField(cursor, type, core::kSampleIdentifier, sample.identifier) ||
        !readField(cursor, type, core::kSampleIp, sample.ip))
    {
        return std::nullopt;
    }

    if (isSet(type, core::kSampleTid))
    {
        sample.pid = cursor.read<std::uint32_t>();
        sample.tid = cursor.read<std::uint32_t>();
        if (!sample.pid || !sample.tid)
        {
            return std::nullopt;
        }
    }

    if (!readField(cursor, type, core::kSampleTime, sample.time) ||
        !readField(cursor, type, core::kSampleAddr, sample.addr) ||
        !readField(cursor, type, core::kSampleId, sample.id) ||
        !readField(cursor, type, core::kSampleStreamId, sample.stream_id))
    {
        return std::nullopt;
    }

    if (isSet(type, core::kSampleCpu))
    {
        // cpu, reserved
        sample.cpu = cursor.read<std::uint32_t>();
        auto reserved = cursor.read<std::uint32_t>();
        if (!sample.cpu || !reserved)
        {
            return std::nullopt;
        }
    }

    if (!readField(cursor, type, core::kSamplePeriod, sample.period))
    {
        return std::nullopt;
    }

    if (isSet(type, core::kSampleRead))
    {
        sample.read = readValues(cursor, layout.read_format);
        if (!sample.read)
        {
            return std::nullopt;
        }
    }

    if (isSet(type, core::kSampleCallchain))
    {
        auto nr = cursor.read<std::uint64_t>();
        if (!nr || *nr > cursor.remaining() / sizeof(std::uint64_t))
        {
            return std::nullopt;
        }
        std::vector<std::uint64_t> ips;
        ips.reserve(*nr);
        for (std::uint64_t i = 0; i < *nr; ++i)
        {
            // Bounds were checked above
            ips.push_back(*cursor.read<std::uint64_t>());
        }
        sample.callchain = std::move(ips);
    }

    if (isSet(type, core::kSampleRaw))
    {
        // The kernel pads size so that the u32 plus data stays u64 aligned
        auto size = cursor.read<std::uint32_t>();
        if (!size)
        {
            return std::nullopt;
        }
        sample.raw = cursor.readBytes(*size);
        if (!sample.raw)
        {
            return std::nullopt;
        }
    }

    if (!readField(cursor, type, core::kSampleWeight, sample.weight) ||
        !readField(cursor, type, core::kSampleDataSrc, sample.data_src) ||
        !readField(cursor, type, core::kSampleTransaction, sample.transaction) ||
        !readField(cursor, type, core::kSamplePhysAddr, sample.phys_addr) ||
        !readField(cursor, type, core::kSampleCgroup, sample.cgroup) ||
        !readField(cursor, type, core::kSampleDataPageSize, sample.data_page_size) ||
        !readField(cursor, type, core::kSampleCodePageSize, sample.code_page_size))
    {
        return std::nullopt;
    }

    return sample;
}

}  // namespace

auto decodeSample(std::span<const std::byte> payload, const core::SampleLayout& layout,
                  std::uint16_t misc) -> std::expected<core::SampleRecord, core::PerfError>
{
    if ((layout.sample_type & ~core::kSupportedSampleFields) != 0)
    {
        return std::unexpected(core::PerfError::kInvalidConfig);
    }

    ByteCursor cursor{payload};
    auto sample = decodeFields(cursor, layout, misc);
    if (!sample)
    {
        PIPA_LOG_DEBUG("sample payload of {} bytes too short for layout {:#x}", payload.size(),
                       layout.sample_type);
        return std::unexpected(core::PerfError::kReadFailed);
    }

    // Trailing bytes mean the layout and the record disagree
    if (cursor.consumed() != payload.size())
    {
        PIPA_LOG_DEBUG("sample payload has {} unread bytes", cursor.remaining());
        return std::unexpected(core::PerfError::kReadFailed);
    }

    return *std::move(sample);
}

auto fixedSampleSize(const core::SampleLayout& layout, std::size_t read_members) noexcept
    -> std::size_t
{
    const std::uint64_t type = layout.sample_type;
    if (isSet(type, core::kSampleCallchain) || isSet(type, core::kSampleRaw))
    {
        return 0;
    }

    constexpr std::size_t kWord = sizeof(std::uint64_t);

    // Every fixed field, including tid and cpu pairs, occupies one word
    constexpr std::uint64_t kWordFields =
        core::kSampleIdentifier | core::kSampleIp | core::kSampleTid | core::kSampleTime |
        core::kSampleAddr | core::kSampleId | core::kSampleStreamId | core::kSampleCpu |
        core::kSamplePeriod | core::kSampleWeight | core::kSampleDataSrc |
        core::kSampleTransaction | core::kSamplePhysAddr | core::kSampleCgroup |
        core::kSampleDataPageSize | core::kSampleCodePageSize;

    std::size_t size = static_cast<std::size_t>(std::popcount(type & kWordFields)) * kWord;

    if (isSet(type, core::kSampleRead))
    {
        const std::uint64_t format = layout.read_format;
        std::size_t times = (isSet(format, core::kFormatTotalTimeEnabled) ? 1 : 0) +
                            (isSet(format, core::kFormatTotalTimeRunning) ? 1 : 0);
        std::size_t per_value = isSet(format, core::kFormatId) ? 2 : 1;

        if (isSet(format, core::kFormatGroup))
        {
            size += (1 + times + (read_members * per_value)) * kWord;
        }
        else
        {
            size += (times + per_value) * kWord;
        }
    }

    return size;
}

}  // namespace pipa::collection
