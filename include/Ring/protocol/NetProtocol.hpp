#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <vector>
#include <spdlog/logger.h>
#include "PDR/Error.h"
#include "Ring/core/SharedRegion.hpp"

namespace PDR {
namespace Ring {

constexpr std::size_t kMaxPacketSize = 1518;   // Ethernet frame without FCS
constexpr std::size_t kNetRingCapacity = 64;

namespace NetFlags {
    constexpr uint32_t kValid = 1u << 0;   // entry carries a frame
    constexpr uint32_t kInUse = 1u << 1;   // producer still filling; never legal once published
    constexpr uint32_t kError = 1u << 2;   // frame received with an error
    constexpr uint32_t kKnownMask = kValid | kInUse | kError;
}

struct NetEntry {
    uint32_t flags;
    uint16_t length;
    uint16_t reserved;
    uint8_t data[kMaxPacketSize];
};
static_assert(sizeof(NetEntry) == 1528, "NetEntry wire size (8 + 1518, padded to 4)");
static_assert(offsetof(NetEntry, data) == 8);

struct NetFrame {
    std::vector<uint8_t> bytes;
    bool rxError{false};

    bool operator==(const NetFrame&) const = default;
};

/**
 * @brief Codec for the network TX and RX channels (one instance per direction).
 *
 * encode() rejects empty frames and frames above kMaxPacketSize. decode()
 * requires VALID, rejects IN_USE and unknown flag bits, a non-zero reserved
 * field, and a length of 0 or above kMaxPacketSize. ERROR is reported as
 * NetFrame::rxError.
 */
struct NetCodec {
    using Event = NetFrame;
    using Entry = NetEntry;
    static constexpr std::size_t kCapacity = kNetRingCapacity;
    static constexpr const char* kName = "net";

    static std::expected<Entry, ProtocolError> encode(const Event& frame) noexcept;
    static std::expected<Event, ProtocolError> decode(const Entry& entry);
};

// --- Link status ---

enum class LinkSpeed : uint8_t {
    Mbps10   = 0,
    Mbps100  = 1,
    Mbps1000 = 2
};

struct MacAddress {
    std::array<uint8_t, 6> octets{};

    std::string toString() const;
    bool operator==(const MacAddress&) const = default;
};

struct LinkStatus {
    MacAddress mac;
    bool up{false};
    LinkSpeed speed{LinkSpeed::Mbps100};
    bool fullDuplex{false};

    bool operator==(const LinkStatus&) const = default;
};

// Status word written by the network domain only. sequence is a seqlock
// counter: odd while an update is in progress, 0 until the first update.
// A published sequence is never 0 again, the counter skips it on wrap.
struct alignas(4) LinkStatusBlock_POD {
    uint32_t sequence;       // 0x00
    uint8_t  mac[6];         // 0x04
    uint8_t  linkUp;         // 0x0A
    uint8_t  speed;          // 0x0B
    uint8_t  fullDuplex;     // 0x0C
    uint8_t  reserved[3];    // 0x0D
};
static_assert(sizeof(LinkStatusBlock_POD) == 16);
static_assert(offsetof(LinkStatusBlock_POD, mac) == 0x04);

class LinkStatusWriter {
public:
    static std::expected<LinkStatusWriter, ProtocolError> attach(const SharedRegion& region,
                                                                 std::shared_ptr<spdlog::logger> logger = nullptr);

    void update(const LinkStatus& status) noexcept;

private:
    LinkStatusWriter(LinkStatusBlock_POD* block, std::shared_ptr<spdlog::logger> logger)
        : block_(block), logger_(std::move(logger)) {}

    LinkStatusBlock_POD* block_;
    std::shared_ptr<spdlog::logger> logger_;
};

class LinkStatusReader {
public:
    static std::expected<LinkStatusReader, ProtocolError> attach(const SharedRegion& region,
                                                                 std::shared_ptr<spdlog::logger> logger = nullptr);

    /**
     * @brief Consistent copy of the link status.
     *
     * @return Status, ChannelNotReady before the first update, BufferBusy if
     *         the writer kept the block busy for every retry, or InvalidField
     *         for out-of-range values
     */
    std::expected<LinkStatus, ProtocolError> read() const noexcept;

    // Sequence value of the last successful read; changes mean a new status.
    uint32_t lastSequence() const noexcept { return lastSequence_; }

private:
    LinkStatusReader(LinkStatusBlock_POD* block, std::shared_ptr<spdlog::logger> logger)
        : block_(block), logger_(std::move(logger)) {}

    static constexpr int kMaxReadAttempts = 16;

    LinkStatusBlock_POD* block_;
    std::shared_ptr<spdlog::logger> logger_;
    mutable uint32_t lastSequence_{0};
};

} // namespace Ring
} // namespace PDR
