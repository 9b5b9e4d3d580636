/**
 *  @file       mapped_region.hpp
 *
 *  RAII ownership of the shared memory mapping behind a sampling counter.
 */

#ifndef PIPA_COLLECTION_MAPPED_REGION_HPP_
#define PIPA_COLLECTION_MAPPED_REGION_HPP_

#include "pipa/core/errors.hpp"

#include <cstddef>
#include <expected>
#include <span>

namespace pipa::collection
{

/**
 *  A perf ring buffer mapping: one control page followed by a power of
 *  two number of data pages, mapped shared and writable so that the
 *  consumer can publish data_tail.
 *
 *  The mapping is released on destruction or by unmap().
 *
 *  This class is move-only; a mapping must have exactly one owner.
 */
class MappedRegion
{
  public:
    /**
     *  Upper bound on data pages per buffer (1 MiB with 4 KiB pages).
     */
    static constexpr std::size_t kMaxDataPages = 256;

    /**
     *  Maps the ring buffer of a perf event.
     *
     *  @param      fd          The sampling counter's file descriptor.
     *  @param      data_pages  Number of data pages; must be a power of two
     *                          no larger than kMaxDataPages.
     *  @return     The mapping, PerfError::kInvalidConfig for a bad page
     *              count, or PerfError::kMappingFailed if mmap() fails.
     */
    [[nodiscard]] static auto map(int fd, std::size_t data_pages)
        -> std::expected<MappedRegion, core::PerfError>;

    /**
     *  Returns the system page size.
     */
    [[nodiscard]] static auto pageSize() noexcept -> std::size_t;

    ~MappedRegion();

    MappedRegion(MappedRegion&& other) noexcept;
    auto operator=(MappedRegion&& other) noexcept -> MappedRegion&;

    // Non-copyable
    MappedRegion(const MappedRegion&) = delete;
    auto operator=(const MappedRegion&) -> MappedRegion& = delete;

    /**
     *  Returns the whole mapping, control page first.
     */
    [[nodiscard]] auto bytes() const noexcept -> std::span<std::byte>;

    /**
     *  Releases the mapping. Unmapping twice is a no-op.
     */
    void unmap() noexcept;

    [[nodiscard]] auto isMapped() const noexcept -> bool;

  private:
    MappedRegion(void* address, std::size_t length) noexcept;

    void* address_;
    std::size_t length_;
};

}  // namespace pipa::collection

#endif  // PIPA_COLLECTION_MAPPED_REGION_HPP_
