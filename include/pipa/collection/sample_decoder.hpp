/**
 *  @file       sample_decoder.hpp
 *
 *  Decoding of PERF_RECORD_SAMPLE payloads.
 *
 *  The kernel writes sample fields in a fixed canonical order that does
 *  not follow the bit order of sample_type. The decoder walks that order
 *  and reads only the fields whose bit is set.
 */

#ifndef PIPA_COLLECTION_SAMPLE_DECODER_HPP_
#define PIPA_COLLECTION_SAMPLE_DECODER_HPP_

#include "pipa/core/errors.hpp"
#include "pipa/core/records.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>

namespace pipa::collection
{

/**
 *  Decodes the payload of one sample record.
 *
 *  The payload is the record body without its 8-byte header. Decoding
 *  succeeds only if every selected field fits and the payload is consumed
 *  exactly; a record is never returned half-decoded.
 *
 *  @param      payload  Record bytes following the header.
 *  @param      layout   The sample_type and read_format of the session.
 *  @param      misc     The header misc flags.
 *  @return     The decoded sample, or PerfError::kReadFailed if the payload
 *              does not match the layout.
 */
[[nodiscard]] auto decodeSample(std::span<const std::byte> payload, const core::SampleLayout& layout,
                                std::uint16_t misc) -> std::expected<core::SampleRecord, core::PerfError>;

/**
 *  Computes the payload size of a sample without variable-length fields.
 *
 *  @param      layout        The session layout.
 *  @param      read_members  Number of counters in a group read (1 if not
 *                            a group).
 *  @return     The payload size in bytes, or 0 if the layout contains
 *              call chains or raw data.
 */
[[nodiscard]] auto fixedSampleSize(const core::SampleLayout& layout,
                                   std::size_t read_members = 1) noexcept -> std::size_t;

}  // namespace pipa::collection

#endif  // PIPA_COLLECTION_SAMPLE_DECODER_HPP_
