/**
 *  @file       records.hpp
 *
 *  Record data structures decoded from the perf sampling ring buffer.
 *
 *  Defines the sample field bitmask, the layout fixed at session creation,
 *  and the record types the ring buffer reader produces.
 */

#ifndef PIPA_CORE_RECORDS_HPP_
#define PIPA_CORE_RECORDS_HPP_

#include "pipa/core/errors.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

namespace pipa::core
{

// Sample field bits. Values equal the kernel's PERF_SAMPLE_* constants and
// are listed in bit order; the payload order is defined by decodeSample().
inline constexpr std::uint64_t kSampleIp = 1ULL << 0;
inline constexpr std::uint64_t kSampleTid = 1ULL << 1;
inline constexpr std::uint64_t kSampleTime = 1ULL << 2;
inline constexpr std::uint64_t kSampleAddr = 1ULL << 3;
inline constexpr std::uint64_t kSampleRead = 1ULL << 4;
inline constexpr std::uint64_t kSampleCallchain = 1ULL << 5;
inline constexpr std::uint64_t kSampleId = 1ULL << 6;
inline constexpr std::uint64_t kSampleCpu = 1ULL << 7;
inline constexpr std::uint64_t kSamplePeriod = 1ULL << 8;
inline constexpr std::uint64_t kSampleStreamId = 1ULL << 9;
inline constexpr std::uint64_t kSampleRaw = 1ULL << 10;
inline constexpr std::uint64_t kSampleBranchStack = 1ULL << 11;
inline constexpr std::uint64_t kSampleRegsUser = 1ULL << 12;
inline constexpr std::uint64_t kSampleStackUser = 1ULL << 13;
inline constexpr std::uint64_t kSampleWeight = 1ULL << 14;
inline constexpr std::uint64_t kSampleDataSrc = 1ULL << 15;
inline constexpr std::uint64_t kSampleIdentifier = 1ULL << 16;
inline constexpr std::uint64_t kSampleTransaction = 1ULL << 17;
inline constexpr std::uint64_t kSampleRegsIntr = 1ULL << 18;
inline constexpr std::uint64_t kSamplePhysAddr = 1ULL << 19;
inline constexpr std::uint64_t kSampleAux = 1ULL << 20;
inline constexpr std::uint64_t kSampleCgroup = 1ULL << 21;
inline constexpr std::uint64_t kSampleDataPageSize = 1ULL << 22;
inline constexpr std::uint64_t kSampleCodePageSize = 1ULL << 23;

/**
 *  Sample fields the decoder understands.
 *
 *  Branch stacks, register dumps, user stacks and AUX data depend on
 *  additional attribute fields and are rejected at configuration time.
 */
inline constexpr std::uint64_t kSupportedSampleFields =
    kSampleIp | kSampleTid | kSampleTime | kSampleAddr | kSampleRead | kSampleCallchain |
    kSampleId | kSampleCpu | kSamplePeriod | kSampleStreamId | kSampleRaw | kSampleWeight |
    kSampleDataSrc | kSampleIdentifier | kSampleTransaction | kSamplePhysAddr | kSampleCgroup |
    kSampleDataPageSize | kSampleCodePageSize;

// Read format bits, equal to the kernel's PERF_FORMAT_* constants.
inline constexpr std::uint64_t kFormatTotalTimeEnabled = 1ULL << 0;
inline constexpr std::uint64_t kFormatTotalTimeRunning = 1ULL << 1;
inline constexpr std::uint64_t kFormatId = 1ULL << 2;
inline constexpr std::uint64_t kFormatGroup = 1ULL << 3;

inline constexpr std::uint64_t kSupportedReadFormat =
    kFormatTotalTimeEnabled | kFormatTotalTimeRunning | kFormatId | kFormatGroup;

/**
 *  The payload shape of sample records, fixed when a session is created.
 */
struct SampleLayout
{
    /**
     *  Bitmask of kSample* fields present in every sample record.
     */
    std::uint64_t sample_type;

    /**
     *  Bitmask of kFormat* bits; only meaningful when kSampleRead is set.
     */
    std::uint64_t read_format;
};

/**
 *  Checks that a layout only uses fields the decoder understands.
 *
 *  @param      layout  The layout to validate.
 *  @return     Success, or PerfError::kInvalidConfig for unsupported bits.
 */
[[nodiscard]] auto validateLayout(const SampleLayout& layout) -> std::expected<void, PerfError>;

/**
 *  Execution context a sample was taken in, from the header misc field.
 */
enum class SamplingMode : std::uint8_t
{
    kUnknown = 0,
    kKernel = 1,
    kUser = 2,
    kHypervisor = 3,
    kGuestKernel = 4,
    kGuestUser = 5,
};

/**
 *  Converts a SamplingMode to its human-readable string representation.
 *
 *  @param      mode  The mode to convert.
 *  @return     A string view naming the mode.
 */
[[nodiscard]] constexpr auto toString(SamplingMode mode) noexcept -> std::string_view
{
    switch (mode)
    {
        case SamplingMode::kKernel:
            return "kernel";
        case SamplingMode::kUser:
            return "user";
        case SamplingMode::kHypervisor:
            return "hypervisor";
        case SamplingMode::kGuestKernel:
            return "guest-kernel";
        case SamplingMode::kGuestUser:
            return "guest-user";
        case SamplingMode::kUnknown:
            return "unknown";
    }
    return "invalid";
}

/**
 *  One counter value carried in a sample's read payload.
 */
struct ReadValue
{
    std::uint64_t value;

    /**
     *  Kernel event id, present when kFormatId is set.
     */
    std::optional<std::uint64_t> id;
};

/**
 *  Counter values snapshotted into a sample (kSampleRead).
 */
struct ReadValues
{
    std::optional<std::uint64_t> time_enabled;
    std::optional<std::uint64_t> time_running;

    /**
     *  One entry for a single counter, or one per member for group reads.
     */
    std::vector<ReadValue> values;
};

/**
 *  A decoded PERF_RECORD_SAMPLE.
 *
 *  Each payload field is present exactly when its bit is set in the
 *  session's SampleLayout. Fields are never zero-filled.
 */
struct SampleRecord
{
    /**
     *  The record header misc flags (mode, exact-ip).
     */
    std::uint16_t misc{0};

    std::optional<std::uint64_t> identifier;
    std::optional<std::uint64_t> ip;
    std::optional<std::uint32_t> pid;
    std::optional<std::uint32_t> tid;

    /**
     *  Timestamp in nanoseconds, clock as configured on the counter.
     */
    std::optional<std::uint64_t> time;

    std::optional<std::uint64_t> addr;
    std::optional<std::uint64_t> id;
    std::optional<std::uint64_t> stream_id;
    std::optional<std::uint32_t> cpu;

    /**
     *  The sampling period in force when this sample was taken.
     *
     *  Under frequency-based sampling the kernel adjusts this continuously.
     */
    std::optional<std::uint64_t> period;

    std::optional<ReadValues> read;
    std::optional<std::vector<std::uint64_t>> callchain;
    std::optional<std::vector<std::byte>> raw;
    std::optional<std::uint64_t> weight;
    std::optional<std::uint64_t> data_src;
    std::optional<std::uint64_t> transaction;
    std::optional<std::uint64_t> phys_addr;
    std::optional<std::uint64_t> cgroup;
    std::optional<std::uint64_t> data_page_size;
    std::optional<std::uint64_t> code_page_size;

    /**
     *  Returns the execution context encoded in the misc flags.
     */
    [[nodiscard]] auto mode() const noexcept -> SamplingMode;

    /**
     *  Checks whether the kernel reported the ip as exact (no skid).
     */
    [[nodiscard]] auto isExactIp() const noexcept -> bool;
};

/**
 *  PERF_RECORD_LOST: the kernel dropped records because the buffer was full.
 */
struct LostRecord
{
    std::uint64_t id;
    std::uint64_t lost;
};

/**
 *  PERF_RECORD_LOST_SAMPLES: samples lost inside the PMU driver.
 */
struct LostSamplesRecord
{
    std::uint64_t lost;
};

/**
 *  PERF_RECORD_THROTTLE / PERF_RECORD_UNTHROTTLE.
 */
struct ThrottleRecord
{
    std::uint64_t time;
    std::uint64_t id;
    std::uint64_t stream_id;
    bool throttled;
};

/**
 *  Any record the ring buffer reader hands to its consumer.
 */
using Record = std::variant<SampleRecord, LostRecord, LostSamplesRecord, ThrottleRecord>;

}  // namespace pipa::core

#endif  // PIPA_CORE_RECORDS_HPP_
