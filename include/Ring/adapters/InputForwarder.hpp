#pragma once

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <spdlog/logger.h>
#include "PDR/Error.h"
#include "Ring/adapters/EventProducer.hpp"
#include "Ring/protocol/InputProtocol.hpp"

namespace PDR {
namespace Ring {

enum class InputBackpressure : uint8_t {
    Drop,       // a full ring drops the event (counted in droppedFull)
    Coalesce    // keep the newest undelivered event and retry it first
};

/**
 * @brief Input-domain front end for the input channel.
 *
 * With Coalesce, at most one event waits locally while the ring is full. A
 * newer event replaces it (only the latest key state matters to the display)
 * and the replaced one is counted as coalesced.
 */
class InputForwarder {
public:
    InputForwarder(EventProducer<InputCodec>& producer,
                   InputBackpressure mode = InputBackpressure::Drop,
                   std::shared_ptr<spdlog::logger> logger = nullptr);

    /**
     * @brief Forward one event (after retrying any pending one).
     * @return Success, or the error that kept the event from being published
     */
    std::expected<void, ProtocolError> forward(const InputEvent& event);

    /// Retry the pending event, if any. Call on the scheduled poll.
    std::expected<void, ProtocolError> flush();

    bool hasPending() const noexcept { return pending_.has_value(); }
    uint64_t coalesced() const noexcept { return coalesced_; }
    InputBackpressure mode() const noexcept { return mode_; }

private:
    EventProducer<InputCodec>& producer_;
    InputBackpressure mode_;
    std::shared_ptr<spdlog::logger> logger_;
    std::optional<InputEvent> pending_;
    uint64_t coalesced_{0};
};

} // namespace Ring
} // namespace PDR
