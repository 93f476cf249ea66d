#pragma once

#include <cstdint>

namespace PDR {
namespace Ring {

using ChannelId = uint32_t;

// Outgoing one-bit notification towards the peer domain. Carries no payload
// and may coalesce with other pending notifications.
class IDoorbell {
public:
    virtual ~IDoorbell() = default;

    // Signal the peer. Never blocks.
    virtual void notify() = 0;

    // Channel id the peer sees this notification arrive on
    virtual ChannelId channel() const = 0;
};

} // namespace Ring
} // namespace PDR
