/**
 *  @file       test_sample_decoder.cpp
 *
 *  Unit tests for sample payload decoding.
 */

#include "pipa/collection/sample_decoder.hpp"
#include "pipa/core/errors.hpp"
#include "pipa/core/records.hpp"

#include <catch2/catch_test_macros.hpp>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <linux/perf_event.h>
#include <vector>

using pipa::collection::decodeSample;
using pipa::collection::fixedSampleSize;
using pipa::core::PerfError;
using pipa::core::SampleLayout;
using pipa::core::SamplingMode;

namespace
{

/**
 *  Appends native-endian fields to a byte buffer.
 */
class PayloadBuilder
{
  public:
    auto u64(std::uint64_t value) -> PayloadBuilder&
    {
        append(&value, sizeof(value));
        return *this;
    }

    auto u32(std::uint32_t value) -> PayloadBuilder&
    {
        append(&value, sizeof(value));
        return *this;
    }

    [[nodiscard]] auto bytes() const -> const std::vector<std::byte>&
    {
        return bytes_;
    }

  private:
    void append(const void* data, std::size_t size)
    {
        auto offset = bytes_.size();
        bytes_.resize(offset + size);
        std::memcpy(bytes_.data() + offset, data, size);
    }

    std::vector<std::byte> bytes_;
};

constexpr std::uint64_t kBasicType = pipa::core::kSampleIp | pipa::core::kSampleTid |
                                     pipa::core::kSampleTime | pipa::core::kSampleCpu |
                                     pipa::core::kSamplePeriod;

}  // namespace

TEST_CASE("decodeSample reads fields in canonical order", "[collection][decodeSample]")
{
    PayloadBuilder payload;
    payload.u64(0x401000)  // ip
        .u32(100)          // pid
        .u32(101)          // tid
        .u64(5000)         // time
        .u32(3)            // cpu
        .u32(0)            // reserved
        .u64(10007);       // period

    auto sample = decodeSample(payload.bytes(), SampleLayout{kBasicType, 0}, PERF_RECORD_MISC_USER);

    REQUIRE(sample.has_value());
    REQUIRE(sample->ip == 0x401000);
    REQUIRE(sample->pid == 100);
    REQUIRE(sample->tid == 101);
    REQUIRE(sample->time == 5000);
    REQUIRE(sample->cpu == 3);
    REQUIRE(sample->period == 10007);
    REQUIRE(sample->mode() == SamplingMode::kUser);
    REQUIRE_FALSE(sample->isExactIp());
    REQUIRE_FALSE(sample->addr.has_value());
    REQUIRE_FALSE(sample->read.has_value());
}

TEST_CASE("decodeSample places identifier first and addr after time", "[collection][decodeSample]")
{
    SampleLayout layout{
        .sample_type = pipa::core::kSampleIdentifier | pipa::core::kSampleIp |
                       pipa::core::kSampleTime | pipa::core::kSampleAddr | pipa::core::kSampleId,
        .read_format = 0,
    };

    PayloadBuilder payload;
    payload.u64(77).u64(0x1000).u64(9).u64(0xdead).u64(77);

    auto sample = decodeSample(payload.bytes(), layout,
                               PERF_RECORD_MISC_KERNEL | PERF_RECORD_MISC_EXACT_IP);

    REQUIRE(sample.has_value());
    REQUIRE(sample->identifier == 77);
    REQUIRE(sample->ip == 0x1000);
    REQUIRE(sample->time == 9);
    REQUIRE(sample->addr == 0xdead);
    REQUIRE(sample->id == 77);
    REQUIRE(sample->mode() == SamplingMode::kKernel);
    REQUIRE(sample->isExactIp());
}

TEST_CASE("decodeSample rejects malformed payloads", "[collection][decodeSample]")
{
    SECTION("payload shorter than the layout")
    {
        PayloadBuilder payload;
        payload.u64(0x401000).u32(100).u32(101);

        auto sample = decodeSample(payload.bytes(), SampleLayout{kBasicType, 0}, 0);
        REQUIRE_FALSE(sample.has_value());
        REQUIRE(sample.error() == PerfError::kReadFailed);
    }

    SECTION("payload longer than the layout")
    {
        PayloadBuilder payload;
        payload.u64(0x401000).u64(42);

        auto sample = decodeSample(payload.bytes(), SampleLayout{pipa::core::kSampleIp, 0}, 0);
        REQUIRE_FALSE(sample.has_value());
        REQUIRE(sample.error() == PerfError::kReadFailed);
    }

    SECTION("unsupported field bits")
    {
        PayloadBuilder payload;
        payload.u64(1);

        auto sample =
            decodeSample(payload.bytes(), SampleLayout{pipa::core::kSampleBranchStack, 0}, 0);
        REQUIRE_FALSE(sample.has_value());
        REQUIRE(sample.error() == PerfError::kInvalidConfig);
    }

    SECTION("callchain count larger than the payload")
    {
        PayloadBuilder payload;
        payload.u64(1000).u64(0x1);

        auto sample =
            decodeSample(payload.bytes(), SampleLayout{pipa::core::kSampleCallchain, 0}, 0);
        REQUIRE_FALSE(sample.has_value());
        REQUIRE(sample.error() == PerfError::kReadFailed);
    }
}

TEST_CASE("decodeSample reads a group read payload", "[collection][decodeSample]")
{
    SampleLayout layout{
        .sample_type = pipa::core::kSampleRead,
        .read_format = pipa::core::kFormatGroup | pipa::core::kFormatId |
                       pipa::core::kFormatTotalTimeEnabled | pipa::core::kFormatTotalTimeRunning,
    };

    PayloadBuilder payload;
    payload.u64(2)      // nr
        .u64(400)       // time_enabled
        .u64(200)       // time_running
        .u64(1111)      // value
        .u64(7)         // id
        .u64(2222)      // value
        .u64(8);        // id

    auto sample = decodeSample(payload.bytes(), layout, 0);

    REQUIRE(sample.has_value());
    REQUIRE(sample->read.has_value());
    REQUIRE(sample->read->time_enabled == 400);
    REQUIRE(sample->read->time_running == 200);
    REQUIRE(sample->read->values.size() == 2);
    REQUIRE(sample->read->values[0].value == 1111);
    REQUIRE(sample->read->values[0].id == 7);
    REQUIRE(sample->read->values[1].value == 2222);
    REQUIRE(sample->read->values[1].id == 8);
}

TEST_CASE("decodeSample reads a single read payload", "[collection][decodeSample]")
{
    SampleLayout layout{
        .sample_type = pipa::core::kSampleRead,
        .read_format = pipa::core::kFormatTotalTimeEnabled | pipa::core::kFormatId,
    };

    PayloadBuilder payload;
    payload.u64(99).u64(500).u64(4);

    auto sample = decodeSample(payload.bytes(), layout, 0);

    REQUIRE(sample.has_value());
    REQUIRE(sample->read->values.size() == 1);
    REQUIRE(sample->read->values[0].value == 99);
    REQUIRE(sample->read->values[0].id == 4);
    REQUIRE(sample->read->time_enabled == 500);
    REQUIRE_FALSE(sample->read->time_running.has_value());
}

TEST_CASE("decodeSample reads callchain and raw data", "[collection][decodeSample]")
{
    SampleLayout layout{
        .sample_type = pipa::core::kSampleCallchain | pipa::core::kSampleRaw |
                       pipa::core::kSampleWeight,
        .read_format = 0,
    };

    PayloadBuilder payload;
    payload.u64(3).u64(0xa).u64(0xb).u64(0xc);  // callchain
    payload.u32(4).u32(0x04030201);             // raw: size, data
    payload.u64(12);                            // weight

    auto sample = decodeSample(payload.bytes(), layout, 0);

    REQUIRE(sample.has_value());
    const std::vector<std::uint64_t> expected_chain{0xa, 0xb, 0xc};
    REQUIRE(sample->callchain == expected_chain);
    REQUIRE(sample->raw.has_value());
    REQUIRE(sample->raw->size() == 4);
    REQUIRE(sample->weight == 12);
}

TEST_CASE("fixedSampleSize", "[collection][fixedSampleSize]")
{
    SECTION("word fields")
    {
        // ip, pid/tid, time, cpu/reserved, period
        REQUIRE(fixedSampleSize(SampleLayout{kBasicType, 0}) == 40);
    }

    SECTION("group read with ids")
    {
        SampleLayout layout{
            .sample_type = pipa::core::kSampleIp | pipa::core::kSampleRead,
            .read_format = pipa::core::kFormatGroup | pipa::core::kFormatId |
                           pipa::core::kFormatTotalTimeEnabled |
                           pipa::core::kFormatTotalTimeRunning,
        };
        // ip + nr + 2 times + 2 * (value, id)
        REQUIRE(fixedSampleSize(layout, 2) == 8 + (3 * 8) + (2 * 16));
    }

    SECTION("variable-length fields")
    {
        REQUIRE(fixedSampleSize(SampleLayout{pipa::core::kSampleCallchain, 0}) == 0);
        REQUIRE(fixedSampleSize(SampleLayout{pipa::core::kSampleRaw, 0}) == 0);
    }
}

TEST_CASE("validateLayout", "[core][SampleLayout]")
{
    REQUIRE(pipa::core::validateLayout(SampleLayout{kBasicType, 0}).has_value());

    auto unsupported = pipa::core::validateLayout(SampleLayout{pipa::core::kSampleRegsUser, 0});
    REQUIRE_FALSE(unsupported.has_value());
    REQUIRE(unsupported.error() == PerfError::kInvalidConfig);

    auto bad_format = pipa::core::validateLayout(
        SampleLayout{pipa::core::kSampleRead, pipa::core::kFormatGroup | (1ULL << 9)});
    REQUIRE_FALSE(bad_format.has_value());
}
