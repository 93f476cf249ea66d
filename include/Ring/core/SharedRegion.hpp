#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <type_traits>
#include <spdlog/logger.h>
#include "PDR/Error.h"

namespace PDR {
namespace Ring {

/**
 * @brief Descriptor of a capability-granted memory region (base + length).
 *
 * Non-owning. Handles built from it never outlive the mapping; on seL4 the
 * mapping lives for the lifetime of the system.
 */
class SharedRegion {
public:
    SharedRegion() = default;
    SharedRegion(void* base, size_t length) noexcept
        : base_(static_cast<std::byte*>(base)), length_(length) {}

    std::byte* base() const noexcept { return base_; }
    size_t length() const noexcept { return length_; }
    bool valid() const noexcept { return base_ != nullptr && length_ != 0; }

    /**
     * @brief Typed, bounds- and alignment-checked view at a byte offset.
     *
     * @param offset Byte offset from the region base
     * @param count Number of consecutive T objects the caller will touch
     * @return Pointer to the first object or OutOfBounds/RegionMisaligned
     */
    template<typename T>
    std::expected<T*, ProtocolError> at(size_t offset, size_t count = 1) const noexcept {
        static_assert(std::is_trivially_copyable_v<T>, "shared memory holds plain data only");
        if (!valid()) return std::unexpected(ProtocolError::OutOfBounds);
        if (count == 0 || offset > length_) return std::unexpected(ProtocolError::OutOfBounds);
        if (count > (length_ - offset) / sizeof(T)) return std::unexpected(ProtocolError::OutOfBounds);
        auto addr = reinterpret_cast<std::uintptr_t>(base_ + offset);
        if (addr % alignof(T) != 0) return std::unexpected(ProtocolError::RegionMisaligned);
        return reinterpret_cast<T*>(base_ + offset);
    }

    /// Sub-region [offset, offset + length).
    std::expected<SharedRegion, ProtocolError> slice(size_t offset, size_t length) const noexcept {
        if (offset > length_ || length > length_ - offset) {
            return std::unexpected(ProtocolError::OutOfBounds);
        }
        return SharedRegion(base_ + offset, length);
    }

private:
    std::byte* base_{nullptr};
    size_t length_{0};
};

/**
 * @brief Owns an anonymous shared mapping standing in for a Microkit memory region.
 *
 * The mapping is page aligned and zero filled, which is also the state the
 * Microkit loader leaves a fresh region in.
 */
class MappedRegion {
public:
    static std::expected<std::unique_ptr<MappedRegion>, ProtocolError>
    create(size_t length, std::shared_ptr<spdlog::logger> logger = nullptr);

    ~MappedRegion();

    MappedRegion(const MappedRegion&) = delete;
    MappedRegion& operator=(const MappedRegion&) = delete;

    SharedRegion region() const noexcept { return SharedRegion(base_, length_); }
    size_t length() const noexcept { return length_; }

private:
    MappedRegion(void* base, size_t length, std::shared_ptr<spdlog::logger> logger);

    void* base_{nullptr};
    size_t length_{0};
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace Ring
} // namespace PDR
