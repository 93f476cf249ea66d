#include "Ring/adapters/InputForwarder.hpp"
#include <spdlog/spdlog.h>

namespace PDR {
namespace Ring {

InputForwarder::InputForwarder(EventProducer<InputCodec>& producer,
                               InputBackpressure mode,
                               std::shared_ptr<spdlog::logger> logger)
    : producer_(producer), mode_(mode), logger_(std::move(logger)) {}

std::expected<void, ProtocolError> InputForwarder::flush() {
    if (!pending_) return {};

    auto result = producer_.publish(*pending_);
    if (result) {
        pending_.reset();
        return {};
    }
    if (result.error() != ProtocolError::ChannelFull && result.error() != ProtocolError::ChannelNotReady) {
        // Not a transient condition; retrying the same event cannot help.
        pending_.reset();
    }
    return result;
}

std::expected<void, ProtocolError> InputForwarder::forward(const InputEvent& event) {
    if (auto flushed = flush(); !flushed) {
        if (mode_ == InputBackpressure::Coalesce &&
            (flushed.error() == ProtocolError::ChannelFull || flushed.error() == ProtocolError::ChannelNotReady)) {
            ++coalesced_;
            pending_ = event;
            if (logger_ && logger_->should_log(spdlog::level::debug)) {
                logger_->debug("InputForwarder: ring still full, coalesced ({} total)", coalesced_);
            }
        }
        return flushed;
    }

    auto result = producer_.publish(event);
    if (!result && mode_ == InputBackpressure::Coalesce &&
        (result.error() == ProtocolError::ChannelFull || result.error() == ProtocolError::ChannelNotReady)) {
        pending_ = event;
    }
    return result;
}

} // namespace Ring
} // namespace PDR
