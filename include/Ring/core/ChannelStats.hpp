#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>
#include "PDR/Error.h"

namespace PDR {
namespace Ring {

// Per-endpoint counters. Each endpoint is driven by a single domain, so these
// are plain integers owned by that domain.
struct ChannelStats {
    // producer side
    uint64_t pushed{0};
    uint64_t droppedFull{0};
    uint64_t encodeRejected{0};
    uint64_t notifications{0};

    // consumer side
    uint64_t popped{0};
    uint64_t decoded{0};
    uint64_t corrupt{0};
    uint64_t notReadyPolls{0};
    uint64_t drains{0};

    bool poisoned{false};

    // Most recent failure, and the leading bytes of the last entry the decoder refused.
    std::optional<ProtocolError> lastError;
    std::vector<uint8_t> lastCorruptEntry;
};

constexpr std::size_t kCorruptDumpBytes = 16;

} // namespace Ring
} // namespace PDR
