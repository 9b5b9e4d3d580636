/**
 *  @file       records.cpp
 *
 *  Implementation of record helpers and layout validation.
 */

#include "pipa/core/records.hpp"

#include "pipa/core/errors.hpp"
#include "pipa/core/logging.hpp"

#include <cstdint>
#include <expected>
#include <linux/perf_event.h>

namespace pipa::core
{

// The bit values are part of the kernel ABI and must never drift.
static_assert(kSampleIp == PERF_SAMPLE_IP);
static_assert(kSampleTid == PERF_SAMPLE_TID);
static_assert(kSampleTime == PERF_SAMPLE_TIME);
static_assert(kSampleAddr == PERF_SAMPLE_ADDR);
static_assert(kSampleRead == PERF_SAMPLE_READ);
static_assert(kSampleCallchain == PERF_SAMPLE_CALLCHAIN);
static_assert(kSampleId == PERF_SAMPLE_ID);
static_assert(kSampleCpu == PERF_SAMPLE_CPU);
static_assert(kSamplePeriod == PERF_SAMPLE_PERIOD);
static_assert(kSampleStreamId == PERF_SAMPLE_STREAM_ID);
static_assert(kSampleRaw == PERF_SAMPLE_RAW);
static_assert(kSampleWeight == PERF_SAMPLE_WEIGHT);
static_assert(kSampleDataSrc == PERF_SAMPLE_DATA_SRC);
static_assert(kSampleIdentifier == PERF_SAMPLE_IDENTIFIER);
static_assert(kSampleTransaction == PERF_SAMPLE_TRANSACTION);
static_assert(kSamplePhysAddr == PERF_SAMPLE_PHYS_ADDR);
static_assert(kFormatTotalTimeEnabled == PERF_FORMAT_TOTAL_TIME_ENABLED);
static_assert(kFormatTotalTimeRunning == PERF_FORMAT_TOTAL_TIME_RUNNING);
static_assert(kFormatId == PERF_FORMAT_ID);
static_assert(kFormatGroup == PERF_FORMAT_GROUP);

auto validateLayout(const SampleLayout& layout) -> std::expected<void, PerfError>
{
    if ((layout.sample_type & ~kSupportedSampleFields) != 0)
    {
        PIPA_LOG_DEBUG("unsupported sample_type bits {:#x}",
                       layout.sample_type & ~kSupportedSampleFields);
        return std::unexpected(PerfError::kInvalidConfig);
    }

    if ((layout.sample_type & kSampleRead) != 0 &&
        (layout.read_format & ~kSupportedReadFormat) != 0)
    {
        PIPA_LOG_DEBUG("unsupported read_format bits {:#x}",
                       layout.read_format & ~kSupportedReadFormat);
        return std::unexpected(PerfError::kInvalidConfig);
    }

    return {};
}

auto SampleRecord::mode() const noexcept -> SamplingMode
{
    switch (misc & PERF_RECORD_MISC_CPUMODE_MASK)
    {
        case PERF_RECORD_MISC_KERNEL:
            return SamplingMode::kKernel;
        case PERF_RECORD_MISC_USER:
            return SamplingMode::kUser;
        case PERF_RECORD_MISC_HYPERVISOR:
            return SamplingMode::kHypervisor;
        case PERF_RECORD_MISC_GUEST_KERNEL:
            return SamplingMode::kGuestKernel;
        case PERF_RECORD_MISC_GUEST_USER:
            return SamplingMode::kGuestUser;
        default:
            return SamplingMode::kUnknown;
    }
}

auto SampleRecord::isExactIp() const noexcept -> bool
{
    return (misc & PERF_RECORD_MISC_EXACT_IP) != 0;
}

}  // namespace pipa::core
