#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <expected>
#include <limits>
#include <memory>
#include <optional>
#include <type_traits>
#include <spdlog/logger.h>
#include "PDR/Error.h"
#include "Ring/core/RingHeader.hpp"
#include "Ring/core/SharedRegion.hpp"

namespace PDR {
namespace Ring {

/**
 * @brief Compile-time layout of a ring region: header, then Capacity slots of Entry.
 *
 * Capacity must be a power of two so that index % Capacity stays continuous
 * when the 64-bit counters wrap.
 */
template<typename Entry, std::size_t Capacity>
struct RingLayout {
    static_assert(isPowerOfTwo(Capacity), "Capacity must be power of two");
    static_assert(Capacity <= std::numeric_limits<uint32_t>::max(), "Capacity must fit the u32 header field");
    static_assert(std::is_trivially_copyable_v<Entry>, "Entry must be trivially copyable");
    static_assert(std::is_standard_layout_v<Entry>, "Entry must be standard layout");

    static constexpr std::size_t kCapacity = Capacity;
    static constexpr uint32_t kEntrySize = static_cast<uint32_t>(sizeof(Entry));
    static constexpr std::size_t kEntriesOffset = alignUp(kRingHeaderSize, alignof(Entry));
    static constexpr std::size_t kRegionBytes = kEntriesOffset + Capacity * sizeof(Entry);
};

namespace detail {

// Resolved pointers into one ring region. Slot access is always reduced
// modulo Capacity, so an index can never address outside the slot array.
template<typename Entry, std::size_t Capacity>
class RingAccess {
public:
    using Layout = RingLayout<Entry, Capacity>;

    static std::expected<RingAccess, ProtocolError> bind(const SharedRegion& region) noexcept {
        if (region.length() < Layout::kRegionBytes) {
            return std::unexpected(ProtocolError::RegionTooSmall);
        }
        auto hdr = region.template at<RingHeader_POD>(0);
        if (!hdr) return std::unexpected(hdr.error());
        auto slots = region.template at<Entry>(Layout::kEntriesOffset, Capacity);
        if (!slots) return std::unexpected(slots.error());
        return RingAccess(*hdr, *slots);
    }

    RingHeader_POD& header() const noexcept { return *header_; }
    Entry* slot(uint64_t index) const noexcept { return &slots_[slotFor<Capacity>(index)]; }

private:
    RingAccess(RingHeader_POD* header, Entry* slots) noexcept : header_(header), slots_(slots) {}

    RingHeader_POD* header_;
    Entry* slots_;
};

} // namespace detail

/**
 * @brief Trusted initializer: zero the counters and publish the layout.
 */
template<typename Entry, std::size_t Capacity>
std::expected<void, ProtocolError> InitializeRing(const SharedRegion& region,
                                                  const std::shared_ptr<spdlog::logger>& logger = nullptr) {
    using Layout = RingLayout<Entry, Capacity>;
    if (region.length() < Layout::kRegionBytes) {
        if (logger) logger->error("InitializeRing: region of {} bytes, layout needs {}",
                                  region.length(), Layout::kRegionBytes);
        return std::unexpected(ProtocolError::RegionTooSmall);
    }
    return InitializeHeader(region, static_cast<uint32_t>(Capacity), Layout::kEntrySize, logger);
}

/**
 * @brief Producer endpoint of a single-producer single-consumer ring.
 *
 * Owns WriteIndex; only ever reads ReadIndex. Once a fatal fault is seen
 * (index range violation or layout mismatch) the endpoint is poisoned and
 * every later call returns ChannelPoisoned without touching shared memory.
 */
template<typename Entry, std::size_t Capacity>
class RingProducer {
public:
    using EntryType = Entry;
    using Layout = RingLayout<Entry, Capacity>;
    static constexpr std::size_t kCapacity = Capacity;

    static std::expected<RingProducer, ProtocolError> attach(const SharedRegion& region,
                                                             std::shared_ptr<spdlog::logger> logger = nullptr) {
        auto access = detail::RingAccess<Entry, Capacity>::bind(region);
        if (!access) {
            if (logger) logger->error("RingProducer::attach: {}", make_error_code(access.error()).message());
            return std::unexpected(access.error());
        }
        return RingProducer(*access, std::move(logger));
    }

    RingProducer(RingProducer&&) noexcept = default;
    RingProducer& operator=(RingProducer&&) noexcept = default;

    // Prevent copying
    RingProducer(const RingProducer&) = delete;
    RingProducer& operator=(const RingProducer&) = delete;

    /**
     * @brief Copy one entry into the next free slot and publish it.
     *
     * @param entry Fully encoded entry
     * @return Occupancy observed just before the publish, or ChannelFull /
     *         ChannelNotReady / a fatal error. The entry is not published on error.
     */
    std::expected<uint64_t, ProtocolError> push(const Entry& entry) noexcept {
        if (poisoned_) return std::unexpected(ProtocolError::ChannelPoisoned);

        RingHeader_POD& hdr = access_.header();
        if (auto ok = ValidateHeader(hdr, static_cast<uint32_t>(Capacity), Layout::kEntrySize); !ok) {
            if (isFatal(ok.error())) poison(ok.error(), 0, 0);
            return std::unexpected(ok.error());
        }

        const uint64_t w = WriteIndexProxy(hdr).load(std::memory_order_relaxed);
        // Acquire pairs with the consumer's release of ReadIndex: its copy out of
        // the slot we are about to reuse has completed.
        const uint64_t r = ReadIndexProxy(hdr).load(std::memory_order_acquire);
        const uint64_t occupied = occupancyOf(w, r);

        if (occupied > Capacity) {
            poison(ProtocolError::IndexRangeViolation, w, r);
            return std::unexpected(ProtocolError::IndexRangeViolation);
        }
        if (occupied == Capacity) {
            return std::unexpected(ProtocolError::ChannelFull);
        }

        std::memcpy(access_.slot(w), &entry, sizeof(Entry));
        WriteIndexProxy(hdr).store(w + 1, std::memory_order_release);
        return occupied;
    }

    bool tryPush(const Entry& entry) noexcept { return push(entry).has_value(); }

    uint64_t occupancy() const noexcept {
        RingHeader_POD& hdr = access_.header();
        return occupancyOf(WriteIndexProxy(hdr).load(std::memory_order_relaxed),
                           ReadIndexProxy(hdr).load(std::memory_order_acquire));
    }

    bool isFull() const noexcept { return occupancy() >= Capacity; }
    bool isEmpty() const noexcept { return occupancy() == 0; }

    bool poisoned() const noexcept { return poisoned_; }
    ProtocolError poisonReason() const noexcept { return poisonReason_; }

    RingSnapshot snapshot() const noexcept { return Snapshot(access_.header()); }

private:
    RingProducer(detail::RingAccess<Entry, Capacity> access, std::shared_ptr<spdlog::logger> logger) noexcept
        : access_(access), logger_(std::move(logger)) {}

    void poison(ProtocolError why, uint64_t w, uint64_t r) noexcept {
        poisoned_ = true;
        poisonReason_ = why;
        if (logger_) {
            logger_->critical("RingProducer: channel poisoned ({}), W={} R={} capacity={}",
                              make_error_code(why).message(), w, r, Capacity);
        }
    }

    detail::RingAccess<Entry, Capacity> access_;
    std::shared_ptr<spdlog::logger> logger_;
    bool poisoned_{false};
    ProtocolError poisonReason_{ProtocolError::Success};
};

/**
 * @brief Consumer endpoint of a single-producer single-consumer ring.
 *
 * Owns ReadIndex; only ever reads WriteIndex. Same poisoning rules as the
 * producer.
 */
template<typename Entry, std::size_t Capacity>
class RingConsumer {
public:
    using EntryType = Entry;
    using Layout = RingLayout<Entry, Capacity>;
    static constexpr std::size_t kCapacity = Capacity;

    static std::expected<RingConsumer, ProtocolError> attach(const SharedRegion& region,
                                                             std::shared_ptr<spdlog::logger> logger = nullptr) {
        auto access = detail::RingAccess<Entry, Capacity>::bind(region);
        if (!access) {
            if (logger) logger->error("RingConsumer::attach: {}", make_error_code(access.error()).message());
            return std::unexpected(access.error());
        }
        return RingConsumer(*access, std::move(logger));
    }

    RingConsumer(RingConsumer&&) noexcept = default;
    RingConsumer& operator=(RingConsumer&&) noexcept = default;

    // Prevent copying
    RingConsumer(const RingConsumer&) = delete;
    RingConsumer& operator=(const RingConsumer&) = delete;

    /**
     * @brief Copy the oldest entry out of the ring and free its slot.
     *
     * @return The entry, or ChannelEmpty / ChannelNotReady / a fatal error
     */
    std::expected<Entry, ProtocolError> pop() noexcept {
        if (poisoned_) return std::unexpected(ProtocolError::ChannelPoisoned);

        RingHeader_POD& hdr = access_.header();
        if (auto ok = ValidateHeader(hdr, static_cast<uint32_t>(Capacity), Layout::kEntrySize); !ok) {
            if (isFatal(ok.error())) poison(ok.error(), 0, 0);
            return std::unexpected(ok.error());
        }

        const uint64_t r = ReadIndexProxy(hdr).load(std::memory_order_relaxed);
        // Acquire pairs with the producer's release of WriteIndex.
        const uint64_t w = WriteIndexProxy(hdr).load(std::memory_order_acquire);
        const uint64_t occupied = occupancyOf(w, r);

        if (occupied > Capacity) {
            poison(ProtocolError::IndexRangeViolation, w, r);
            return std::unexpected(ProtocolError::IndexRangeViolation);
        }
        if (occupied == 0) {
            return std::unexpected(ProtocolError::ChannelEmpty);
        }

        Entry out;
        std::memcpy(&out, access_.slot(r), sizeof(Entry));
        ReadIndexProxy(hdr).store(r + 1, std::memory_order_release);
        return out;
    }

    std::optional<Entry> tryPop() noexcept {
        auto entry = pop();
        if (!entry) return std::nullopt;
        return *entry;
    }

    uint64_t occupancy() const noexcept {
        RingHeader_POD& hdr = access_.header();
        return occupancyOf(WriteIndexProxy(hdr).load(std::memory_order_acquire),
                           ReadIndexProxy(hdr).load(std::memory_order_relaxed));
    }

    bool isEmpty() const noexcept { return occupancy() == 0; }

    bool poisoned() const noexcept { return poisoned_; }
    ProtocolError poisonReason() const noexcept { return poisonReason_; }

    RingSnapshot snapshot() const noexcept { return Snapshot(access_.header()); }

private:
    RingConsumer(detail::RingAccess<Entry, Capacity> access, std::shared_ptr<spdlog::logger> logger) noexcept
        : access_(access), logger_(std::move(logger)) {}

    void poison(ProtocolError why, uint64_t w, uint64_t r) noexcept {
        poisoned_ = true;
        poisonReason_ = why;
        if (logger_) {
            logger_->critical("RingConsumer: channel poisoned ({}), W={} R={} capacity={}",
                              make_error_code(why).message(), w, r, Capacity);
        }
    }

    detail::RingAccess<Entry, Capacity> access_;
    std::shared_ptr<spdlog::logger> logger_;
    bool poisoned_{false};
    ProtocolError poisonReason_{ProtocolError::Success};
};

} // namespace Ring
} // namespace PDR
