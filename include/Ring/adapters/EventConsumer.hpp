#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <expected>
#include <functional>
#include <memory>
#include <vector>
#include <spdlog/logger.h>
#include <spdlog/fmt/bin_to_hex.h>
#include "PDR/Error.h"
#include "Ring/core/ChannelStats.hpp"
#include "Ring/core/RingChannel.hpp"

namespace PDR {
namespace Ring {

struct DrainReport {
    std::size_t delivered{0};   // decoded and handed to the handler
    std::size_t corrupt{0};     // popped but rejected by the decoder
    bool notReady{false};       // header not initialized yet
};

/**
 * @brief Consumer-side adapter: drain the ring on a wakeup and decode entries.
 *
 * A rejected entry is counted and skipped; draining continues. A fatal channel
 * error ends the drain and is returned, after which the ring is poisoned.
 */
template<typename Codec>
class EventConsumer {
public:
    using Event = typename Codec::Event;
    using Entry = typename Codec::Entry;
    using Ring = RingConsumer<Entry, Codec::kCapacity>;
    using Handler = std::function<void(const Event&)>;

    explicit EventConsumer(Ring ring, std::shared_ptr<spdlog::logger> logger = nullptr)
        : ring_(std::move(ring)), logger_(std::move(logger)) {}

    static std::expected<EventConsumer, ProtocolError> attach(const SharedRegion& region,
                                                              std::shared_ptr<spdlog::logger> logger = nullptr) {
        auto ring = Ring::attach(region, logger);
        if (!ring) return std::unexpected(ring.error());
        return EventConsumer(std::move(*ring), std::move(logger));
    }

    /**
     * @brief Pop until empty, delivering each decoded event in order.
     *
     * @param handler Called once per valid event
     * @param maxEntries Stop after this many pops (0 means until empty)
     */
    std::expected<DrainReport, ProtocolError> drain(const Handler& handler, std::size_t maxEntries = 0) {
        DrainReport report;
        ++stats_.drains;

        for (;;) {
            if (maxEntries != 0 && report.delivered + report.corrupt >= maxEntries) {
                return report;
            }

            auto entry = ring_.pop();
            if (!entry) {
                switch (entry.error()) {
                    case ProtocolError::ChannelEmpty:
                        return report;
                    case ProtocolError::ChannelNotReady:
                        ++stats_.notReadyPolls;
                        report.notReady = true;
                        if (logger_) logger_->debug("{} consumer: channel not initialized yet", Codec::kName);
                        return report;
                    default:
                        stats_.poisoned = ring_.poisoned();
                        stats_.lastError = entry.error();
                        return std::unexpected(entry.error());
                }
            }
            ++stats_.popped;

            auto event = Codec::decode(*entry);
            if (!event) {
                ++stats_.corrupt;
                ++report.corrupt;
                stats_.lastError = event.error();
                stats_.lastCorruptEntry.resize(sizeof(Entry) < kCorruptDumpBytes ? sizeof(Entry) : kCorruptDumpBytes);
                std::memcpy(stats_.lastCorruptEntry.data(), &*entry, stats_.lastCorruptEntry.size());
                if (logger_) {
                    logger_->warn("{} consumer: rejected entry ({}): {}", Codec::kName,
                                  make_error_code(event.error()).message(), spdlog::to_hex(stats_.lastCorruptEntry));
                }
                continue;
            }

            ++stats_.decoded;
            ++report.delivered;
            handler(*event);
        }
    }

    const ChannelStats& stats() const noexcept { return stats_; }
    Ring& ring() noexcept { return ring_; }
    const Ring& ring() const noexcept { return ring_; }

private:
    Ring ring_;
    std::shared_ptr<spdlog::logger> logger_;
    ChannelStats stats_;
};

} // namespace Ring
} // namespace PDR
