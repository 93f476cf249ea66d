#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <spdlog/logger.h>
#include "PDR/Error.h"
#include "Ring/core/Doorbell.hpp"

namespace PDR {
namespace Ring {

/**
 * @brief Event loop of one protection domain.
 *
 * Handlers are registered per incoming channel id. Each wakeup invokes every
 * signalled handler once; a handler drains its channel completely. A handler
 * that reports a fatal error faults only its own channel, which is then never
 * invoked again.
 */
class DomainRuntime {
public:
    using ChannelHandler = std::function<std::expected<void, ProtocolError>()>;

    explicit DomainRuntime(std::string name, std::shared_ptr<spdlog::logger> logger = nullptr);

    // Prevent copying
    DomainRuntime(const DomainRuntime&) = delete;
    DomainRuntime& operator=(const DomainRuntime&) = delete;

    std::expected<void, ProtocolError> registerHandler(ChannelId id, ChannelHandler handler);

    /// Dispatch one wakeup.
    void notified(const ChannelSet& channels);

    /// Scheduled poll: run every live handler, covering lost wakeups.
    void poll();

    /**
     * @brief Block on the endpoint and dispatch until stop is set.
     *
     * A wait that times out runs poll(). Returns IOError if waiting fails.
     */
    std::expected<void, ProtocolError> run(NotificationEndpoint& endpoint,
                                           const std::atomic<bool>& stop,
                                           std::chrono::milliseconds pollInterval);

    bool faulted(ChannelId id) const { return faulted_.count(id) != 0; }
    uint64_t wakeups() const noexcept { return wakeups_; }
    uint64_t polls() const noexcept { return polls_; }
    const std::string& name() const noexcept { return name_; }

private:
    void dispatch(ChannelId id, const ChannelHandler& handler);

    std::string name_;
    std::shared_ptr<spdlog::logger> logger_;
    std::map<ChannelId, ChannelHandler> handlers_;
    std::set<ChannelId> faulted_;
    uint64_t wakeups_{0};
    uint64_t polls_{0};
};

} // namespace Ring
} // namespace PDR
