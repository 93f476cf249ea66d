#pragma once

#include <cstdint>
#include <expected>
#include <memory>
#include <spdlog/logger.h>
#include "PDR/Error.h"
#include "Ring/core/ChannelStats.hpp"
#include "Ring/core/Doorbell.hpp"
#include "Ring/core/RingChannel.hpp"
#include "Ring/interfaces/IDoorbell.hpp"

namespace PDR {
namespace Ring {

/**
 * @brief Producer-side adapter: encode a domain event, push it, ring the doorbell.
 *
 * Codec supplies Event, Entry, kCapacity, kName and static encode(). A full
 * ring drops the event and counts it; the caller decides whether to retry.
 */
template<typename Codec>
class EventProducer {
public:
    using Event = typename Codec::Event;
    using Entry = typename Codec::Entry;
    using Ring = RingProducer<Entry, Codec::kCapacity>;

    EventProducer(Ring ring, IDoorbell& doorbell,
                  NotifyPolicy policy = NotifyPolicy::EveryPush,
                  std::shared_ptr<spdlog::logger> logger = nullptr)
        : ring_(std::move(ring)), doorbell_(doorbell), policy_(policy), logger_(std::move(logger)) {}

    static std::expected<EventProducer, ProtocolError> attach(const SharedRegion& region, IDoorbell& doorbell,
                                                              NotifyPolicy policy = NotifyPolicy::EveryPush,
                                                              std::shared_ptr<spdlog::logger> logger = nullptr) {
        auto ring = Ring::attach(region, logger);
        if (!ring) return std::unexpected(ring.error());
        return EventProducer(std::move(*ring), doorbell, policy, std::move(logger));
    }

    /**
     * @brief Publish one event.
     *
     * @return ChannelFull (dropped), ChannelNotReady, an encode error, or a
     *         fatal channel error. Nothing is published on error.
     */
    std::expected<void, ProtocolError> publish(const Event& event) {
        auto entry = Codec::encode(event);
        if (!entry) {
            ++stats_.encodeRejected;
            stats_.lastError = entry.error();
            if (logger_) logger_->warn("{} producer: event rejected by encoder: {}",
                                       Codec::kName, make_error_code(entry.error()).message());
            return std::unexpected(entry.error());
        }

        auto pushed = ring_.push(*entry);
        if (!pushed) {
            const ProtocolError error = pushed.error();
            if (error == ProtocolError::ChannelFull) {
                ++stats_.droppedFull;
                if (logger_ && logger_->should_log(spdlog::level::debug)) {
                    logger_->debug("{} producer: ring full, dropped event (total dropped {})",
                                   Codec::kName, stats_.droppedFull);
                }
            } else if (isFatal(error)) {
                stats_.poisoned = true;
                stats_.lastError = error;
            } else if (logger_) {
                logger_->debug("{} producer: push deferred: {}", Codec::kName, make_error_code(error).message());
            }
            return std::unexpected(error);
        }

        ++stats_.pushed;
        if (logger_ && logger_->should_log(spdlog::level::trace)) {
            logger_->trace("{} producer: pushed, occupancy before={}", Codec::kName, *pushed);
        }

        if (policy_ == NotifyPolicy::EveryPush || *pushed == 0) {
            doorbell_.notify();
            ++stats_.notifications;
        }
        return {};
    }

    const ChannelStats& stats() const noexcept { return stats_; }
    Ring& ring() noexcept { return ring_; }
    const Ring& ring() const noexcept { return ring_; }
    NotifyPolicy policy() const noexcept { return policy_; }

private:
    Ring ring_;
    IDoorbell& doorbell_;
    NotifyPolicy policy_;
    std::shared_ptr<spdlog::logger> logger_;
    ChannelStats stats_;
};

} // namespace Ring
} // namespace PDR
