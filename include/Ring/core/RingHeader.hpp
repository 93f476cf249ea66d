// RingHeader.hpp
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <spdlog/logger.h>
#include "PDR/Error.h"
#include "Ring/core/SharedRegion.hpp"

namespace PDR {
namespace Ring {

constexpr uint32_t kRingAbiVersion = 1;
constexpr std::size_t kRingHeaderSize = 32;

// --- POD Structures ---

// Control block at offset 0 of every ring region.
// capacity doubles as the "ready" flag: the initializer stores it last.
// Not the packed 16-byte {capacity u32, write u64 @0x04, read u64 @0x0C}
// header older peers use: entrySize fills 0x04 so both u64 counters sit on
// 8-byte boundaries. Peers must be built against this layout (abiVersion 1).
struct alignas(8) RingHeader_POD {
    uint32_t capacity;        // 0x00 - 0 until initialized
    uint32_t entrySize;       // 0x04 - sizeof(Entry)
    uint64_t writeIndex;      // 0x08 - producer owned, monotonic
    uint64_t readIndex;       // 0x10 - consumer owned, monotonic
    uint32_t abiVersion;      // 0x18
    uint32_t reserved;        // 0x1C
};

static_assert(sizeof(RingHeader_POD) == kRingHeaderSize);
static_assert(offsetof(RingHeader_POD, capacity) == 0x00);
static_assert(offsetof(RingHeader_POD, entrySize) == 0x04);
static_assert(offsetof(RingHeader_POD, writeIndex) == 0x08, "writeIndex must be 8-byte aligned");
static_assert(offsetof(RingHeader_POD, readIndex) == 0x10, "readIndex must be 8-byte aligned");
static_assert(offsetof(RingHeader_POD, abiVersion) == 0x18);

static_assert(std::atomic<uint64_t>::is_always_lock_free, "64-bit counters must be lock-free");
static_assert(std::atomic<uint32_t>::is_always_lock_free);
static_assert(sizeof(std::atomic<uint64_t>) == sizeof(uint64_t));
static_assert(sizeof(std::atomic<uint32_t>) == sizeof(uint32_t));

// --- Atomic Proxies ---
inline std::atomic<uint64_t>& WriteIndexProxy(RingHeader_POD& h) noexcept {
    return *reinterpret_cast<std::atomic<uint64_t>*>(&h.writeIndex);
}
inline std::atomic<uint64_t>& ReadIndexProxy(RingHeader_POD& h) noexcept {
    return *reinterpret_cast<std::atomic<uint64_t>*>(&h.readIndex);
}
inline std::atomic<uint32_t>& CapacityProxy(RingHeader_POD& h) noexcept {
    return *reinterpret_cast<std::atomic<uint32_t>*>(&h.capacity);
}

// --- Index arithmetic ---

constexpr bool isPowerOfTwo(std::size_t x) noexcept {
    return x != 0 && (x & (x - 1)) == 0;
}

constexpr std::size_t alignUp(std::size_t value, std::size_t alignment) noexcept {
    return (value + alignment - 1) / alignment * alignment;
}

/// Wrapping difference of the two monotonic counters.
constexpr uint64_t occupancyOf(uint64_t writeIndex, uint64_t readIndex) noexcept {
    return writeIndex - readIndex;
}

template<std::size_t Capacity>
constexpr std::size_t slotFor(uint64_t index) noexcept {
    static_assert(isPowerOfTwo(Capacity), "Capacity must be a power of two");
    return static_cast<std::size_t>(index % Capacity);
}

/// Point-in-time copy of a header, for diagnostics.
struct RingSnapshot {
    uint32_t capacity{0};
    uint32_t entrySize{0};
    uint32_t abiVersion{0};
    uint64_t writeIndex{0};
    uint64_t readIndex{0};

    uint64_t occupancy() const noexcept { return occupancyOf(writeIndex, readIndex); }
};

inline RingSnapshot Snapshot(RingHeader_POD& h) noexcept {
    RingSnapshot s;
    s.capacity   = CapacityProxy(h).load(std::memory_order_acquire);
    s.entrySize  = h.entrySize;
    s.abiVersion = h.abiVersion;
    s.writeIndex = WriteIndexProxy(h).load(std::memory_order_acquire);
    s.readIndex  = ReadIndexProxy(h).load(std::memory_order_acquire);
    return s;
}

// --- Format Validation ---

/**
 * @brief Check the header against the layout this side was compiled for.
 *
 * A zero capacity means the initializer has not run yet (ChannelNotReady),
 * whatever the counters read. Any other disagreement is a LayoutMismatch.
 */
inline std::expected<void, ProtocolError> ValidateHeader(RingHeader_POD& h,
                                                         uint32_t expectedCapacity,
                                                         uint32_t expectedEntrySize) noexcept {
    const uint32_t cap = CapacityProxy(h).load(std::memory_order_acquire);
    if (cap == 0) return std::unexpected(ProtocolError::ChannelNotReady);
    if (cap != expectedCapacity) return std::unexpected(ProtocolError::LayoutMismatch);
    if (h.entrySize != expectedEntrySize) return std::unexpected(ProtocolError::LayoutMismatch);
    if (h.abiVersion != kRingAbiVersion) return std::unexpected(ProtocolError::LayoutMismatch);
    return {};
}

/**
 * @brief Trusted one-time initialization of a ring header.
 *
 * Zeroes both counters, records the layout, then publishes the capacity with
 * release ordering. Must run before either side touches the channel.
 *
 * @param region Region holding the header at offset 0
 * @param capacity Number of entry slots (power of two)
 * @param entrySize sizeof(Entry)
 * @param logger Optional logger
 */
std::expected<void, ProtocolError> InitializeHeader(const SharedRegion& region,
                                                    uint32_t capacity,
                                                    uint32_t entrySize,
                                                    const std::shared_ptr<spdlog::logger>& logger = nullptr);

} // namespace Ring
} // namespace PDR
