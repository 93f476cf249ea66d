#include "Ring/DomainRuntime.hpp"
#include <spdlog/spdlog.h>

namespace PDR {
namespace Ring {

DomainRuntime::DomainRuntime(std::string name, std::shared_ptr<spdlog::logger> logger)
    : name_(std::move(name)), logger_(std::move(logger)) {}

std::expected<void, ProtocolError> DomainRuntime::registerHandler(ChannelId id, ChannelHandler handler) {
    if (id > kMaxChannelId || !handler) {
        if (logger_) logger_->error("{}: invalid handler registration for channel {}", name_, id);
        return std::unexpected(ProtocolError::InvalidConfig);
    }
    if (!handlers_.emplace(id, std::move(handler)).second) {
        if (logger_) logger_->error("{}: channel {} already has a handler", name_, id);
        return std::unexpected(ProtocolError::InvalidConfig);
    }
    if (logger_) logger_->debug("{}: handler registered for channel {}", name_, id);
    return {};
}

void DomainRuntime::dispatch(ChannelId id, const ChannelHandler& handler) {
    if (faulted_.count(id)) return;

    auto result = handler();
    if (result) return;

    if (isFatal(result.error())) {
        faulted_.insert(id);
        if (logger_) logger_->critical("{}: channel {} faulted ({}), handler disabled",
                                       name_, id, make_error_code(result.error()).message());
    } else if (logger_) {
        logger_->warn("{}: channel {} handler failed: {}", name_, id, make_error_code(result.error()).message());
    }
}

void DomainRuntime::notified(const ChannelSet& channels) {
    ++wakeups_;
    channels.forEach([this](ChannelId id) {
        auto it = handlers_.find(id);
        if (it == handlers_.end()) {
            if (logger_) logger_->warn("{}: notification on unhandled channel {}", name_, id);
            return;
        }
        dispatch(id, it->second);
    });
}

void DomainRuntime::poll() {
    ++polls_;
    for (const auto& [id, handler] : handlers_) {
        dispatch(id, handler);
    }
}

std::expected<void, ProtocolError> DomainRuntime::run(NotificationEndpoint& endpoint,
                                                      const std::atomic<bool>& stop,
                                                      std::chrono::milliseconds pollInterval) {
    if (logger_) logger_->info("{}: event loop started (poll every {} ms)", name_, pollInterval.count());

    while (!stop.load(std::memory_order_acquire)) {
        auto channels = endpoint.wait(pollInterval);
        if (!channels) {
            if (logger_) logger_->error("{}: wait failed: {}", name_, make_error_code(channels.error()).message());
            return std::unexpected(channels.error());
        }
        if (channels->empty()) {
            poll();
        } else {
            notified(*channels);
        }
    }

    if (logger_) logger_->info("{}: event loop stopped after {} wakeups, {} polls", name_, wakeups_, polls_);
    return {};
}

} // namespace Ring
} // namespace PDR
