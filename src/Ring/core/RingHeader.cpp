#include "Ring/core/RingHeader.hpp"
#include <spdlog/spdlog.h>

namespace PDR {
namespace Ring {

std::expected<void, ProtocolError> InitializeHeader(const SharedRegion& region,
                                                    uint32_t capacity,
                                                    uint32_t entrySize,
                                                    const std::shared_ptr<spdlog::logger>& logger) {
    if (!isPowerOfTwo(capacity) || entrySize == 0) {
        if (logger) logger->error("InitializeHeader: invalid layout capacity={} entrySize={}", capacity, entrySize);
        return std::unexpected(ProtocolError::LayoutMismatch);
    }

    auto hdrResult = region.at<RingHeader_POD>(0);
    if (!hdrResult) {
        if (logger) logger->error("InitializeHeader: cannot place header: {}",
                                  make_error_code(hdrResult.error()).message());
        return std::unexpected(hdrResult.error());
    }
    RingHeader_POD& hdr = **hdrResult;

    // Withdraw readiness first so a peer never pairs old counters with a new layout.
    CapacityProxy(hdr).store(0, std::memory_order_release);
    WriteIndexProxy(hdr).store(0, std::memory_order_relaxed);
    ReadIndexProxy(hdr).store(0, std::memory_order_relaxed);
    hdr.entrySize  = entrySize;
    hdr.abiVersion = kRingAbiVersion;
    hdr.reserved   = 0;
    CapacityProxy(hdr).store(capacity, std::memory_order_release);

    if (logger) {
        logger->debug("InitializeHeader: ring at {} ready, capacity={} entrySize={}",
                      static_cast<void*>(region.base()), capacity, entrySize);
    }
    return {};
}

} // namespace Ring
} // namespace PDR
