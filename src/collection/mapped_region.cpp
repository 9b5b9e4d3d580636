/**
 *  @file       mapped_region.cpp
 *
 *  Implementation of the ring buffer mapping.
 */

#include "pipa/collection/mapped_region.hpp"

#include "pipa/core/errors.hpp"
#include "pipa/core/logging.hpp"

#include <bit>
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <expected>
#include <span>
#include <sys/mman.h>
#include <unistd.h>
#include <utility>

namespace pipa::collection
{

MappedRegion::MappedRegion(void* address, std::size_t length) noexcept
    : address_(address), length_(length)
{
}

MappedRegion::~MappedRegion()
{
    unmap();
}

MappedRegion::MappedRegion(MappedRegion&& other) noexcept
    : address_(std::exchange(other.address_, nullptr)), length_(std::exchange(other.length_, 0))
{
}

auto MappedRegion::operator=(MappedRegion&& other) noexcept -> MappedRegion&
{
    if (this != &other)
    {
        unmap();
        address_ = std::exchange(other.address_, nullptr);
        length_ = std::exchange(other.length_, 0);
    }
    return *this;
}

auto MappedRegion::map(int fd, std::size_t data_pages) -> std::expected<MappedRegion, core::PerfError>
{
    if (data_pages == 0 || data_pages > kMaxDataPages || !std::has_single_bit(data_pages))
    {
        return std::unexpected(core::PerfError::kInvalidConfig);
    }

    if (fd < 0)
    {
        return std::unexpected(core::PerfError::kInvalidState);
    }

    std::size_t length = (1 + data_pages) * pageSize();

    // PROT_WRITE is required for the consumer to publish data_tail
    void* address = mmap(nullptr, length, PROT_READ | PROT_WRITE, MAP_SHARED, fd, 0);
    if (address == MAP_FAILED)
    {
        int err = errno;
        PIPA_LOG_ERROR("mmap of {} data pages failed: {}", data_pages, std::strerror(err));
        return std::unexpected(core::PerfError::kMappingFailed);
    }

    return MappedRegion{address, length};
}

auto MappedRegion::pageSize() noexcept -> std::size_t
{
    long size = sysconf(_SC_PAGESIZE);
    constexpr std::size_t kFallbackPageSize = 4096;
    return size > 0 ? static_cast<std::size_t>(size) : kFallbackPageSize;
}

auto MappedRegion::bytes() const noexcept -> std::span<std::byte>
{
    if (address_ == nullptr)
    {
        return {};
    }
    return {static_cast<std::byte*>(address_), length_};
}

void MappedRegion::unmap() noexcept
{
    if (address_ != nullptr)
    {
        munmap(address_, length_);
        address_ = nullptr;
        length_ = 0;
    }
}

auto MappedRegion::isMapped() const noexcept -> bool
{
    return address_ != nullptr;
}

}  // namespace pipa::collection
