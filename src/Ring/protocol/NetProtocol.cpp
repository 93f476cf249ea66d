#include "Ring/protocol/NetProtocol.hpp"
#include <atomic>
#include <cstring>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace PDR {
namespace Ring {

std::expected<NetEntry, ProtocolError> NetCodec::encode(const NetFrame& frame) noexcept {
    if (frame.bytes.empty()) return std::unexpected(ProtocolError::EmptyPayload);
    if (frame.bytes.size() > kMaxPacketSize) return std::unexpected(ProtocolError::PayloadTooLarge);

    NetEntry entry{};
    entry.flags = NetFlags::kValid | (frame.rxError ? NetFlags::kError : 0u);
    entry.length = static_cast<uint16_t>(frame.bytes.size());
    entry.reserved = 0;
    std::memcpy(entry.data, frame.bytes.data(), frame.bytes.size());
    return entry;
}

std::expected<NetFrame, ProtocolError> NetCodec::decode(const NetEntry& entry) {
    if ((entry.flags & ~NetFlags::kKnownMask) != 0) return std::unexpected(ProtocolError::UnknownDiscriminant);
    if ((entry.flags & NetFlags::kValid) == 0) return std::unexpected(ProtocolError::InvalidField);
    if ((entry.flags & NetFlags::kInUse) != 0) return std::unexpected(ProtocolError::InvalidField);
    if (entry.reserved != 0) return std::unexpected(ProtocolError::InvalidField);
    if (entry.length == 0 || entry.length > kMaxPacketSize) return std::unexpected(ProtocolError::LengthOutOfRange);

    NetFrame frame;
    frame.bytes.assign(entry.data, entry.data + entry.length);
    frame.rxError = (entry.flags & NetFlags::kError) != 0;
    return frame;
}

std::string MacAddress::toString() const {
    return fmt::format("{:02x}:{:02x}:{:02x}:{:02x}:{:02x}:{:02x}",
                       octets[0], octets[1], octets[2], octets[3], octets[4], octets[5]);
}

namespace {

std::atomic<uint32_t>& SequenceProxy(LinkStatusBlock_POD& block) noexcept {
    return *reinterpret_cast<std::atomic<uint32_t>*>(&block.sequence);
}

std::expected<LinkStatusBlock_POD*, ProtocolError> placeBlock(const SharedRegion& region) {
    return region.at<LinkStatusBlock_POD>(0);
}

} // anonymous namespace

std::expected<LinkStatusWriter, ProtocolError>
LinkStatusWriter::attach(const SharedRegion& region, std::shared_ptr<spdlog::logger> logger) {
    auto block = placeBlock(region);
    if (!block) {
        if (logger) logger->error("LinkStatusWriter::attach: {}", make_error_code(block.error()).message());
        return std::unexpected(block.error());
    }
    return LinkStatusWriter(*block, std::move(logger));
}

void LinkStatusWriter::update(const LinkStatus& status) noexcept {
    auto& seq = SequenceProxy(*block_);
    const uint32_t start = seq.load(std::memory_order_relaxed);
    // Keep the counter even at rest; an odd start means a torn earlier write.
    const uint32_t busy = (start | 1u) + ((start & 1u) ? 2u : 0u);

    seq.store(busy, std::memory_order_relaxed);
    std::atomic_thread_fence(std::memory_order_release);

    std::memcpy(block_->mac, status.mac.octets.data(), status.mac.octets.size());
    block_->linkUp = status.up ? 1 : 0;
    block_->speed = static_cast<uint8_t>(status.speed);
    block_->fullDuplex = status.fullDuplex ? 1 : 0;
    std::memset(block_->reserved, 0, sizeof(block_->reserved));

    uint32_t published = busy + 1;
    if (published == 0) published = 2;   // 0 reads as "never written"
    seq.store(published, std::memory_order_release);

    if (logger_) {
        logger_->info("Link {} {} speed={} {}", status.mac.toString(), status.up ? "up" : "down",
                      static_cast<int>(status.speed), status.fullDuplex ? "full-duplex" : "half-duplex");
    }
}

std::expected<LinkStatusReader, ProtocolError>
LinkStatusReader::attach(const SharedRegion& region, std::shared_ptr<spdlog::logger> logger) {
    auto block = placeBlock(region);
    if (!block) {
        if (logger) logger->error("LinkStatusReader::attach: {}", make_error_code(block.error()).message());
        return std::unexpected(block.error());
    }
    return LinkStatusReader(*block, std::move(logger));
}

std::expected<LinkStatus, ProtocolError> LinkStatusReader::read() const noexcept {
    auto& seq = SequenceProxy(*block_);

    for (int attempt = 0; attempt < kMaxReadAttempts; ++attempt) {
        const uint32_t before = seq.load(std::memory_order_acquire);
        if (before == 0) return std::unexpected(ProtocolError::ChannelNotReady);
        if (before & 1u) continue;

        LinkStatusBlock_POD copy;
        std::memcpy(&copy, block_, sizeof(copy));
        std::atomic_thread_fence(std::memory_order_acquire);
        if (seq.load(std::memory_order_relaxed) != before) continue;

        if (copy.linkUp > 1 || copy.fullDuplex > 1 ||
            copy.speed > static_cast<uint8_t>(LinkSpeed::Mbps1000)) {
            if (logger_) logger_->warn("LinkStatusReader: rejected status block (up={} speed={} duplex={})",
                                       copy.linkUp, copy.speed, copy.fullDuplex);
            return std::unexpected(ProtocolError::InvalidField);
        }

        LinkStatus status;
        std::memcpy(status.mac.octets.data(), copy.mac, sizeof(copy.mac));
        status.up = copy.linkUp == 1;
        status.speed = static_cast<LinkSpeed>(copy.speed);
        status.fullDuplex = copy.fullDuplex == 1;
        lastSequence_ = before;
        return status;
    }
    return std::unexpected(ProtocolError::BufferBusy);
}

} // namespace Ring
} // namespace PDR
