#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <vector>
#include <spdlog/logger.h>
#include <nlohmann/json_fwd.hpp>
#include "PDR/Error.h"
#include "Ring/core/Doorbell.hpp"

namespace PDR {

enum class ChannelKind : uint8_t {
    Input,          // input events ring
    NetTx,          // client -> network domain frames
    NetRx,          // network domain -> client frames
    NetStatus,      // link status block
    PhotoCommand,   // photo command ring
    PixelBuffer     // decoder -> display image handshake
};

struct ChannelConfig {
    std::string name;
    ChannelKind kind{ChannelKind::Input};
    Ring::ChannelId channelId{0};
    std::size_t regionSize{0};
    Ring::NotifyPolicy policy{Ring::NotifyPolicy::EveryPush};
};

/// Smallest region that holds the layout of a channel kind.
std::size_t requiredRegionBytes(ChannelKind kind) noexcept;

/**
 * @brief Static description of a deployment: which channels exist, which
 * notification ids they use, how big their regions are.
 *
 * JSON form:
 * @code
 * { "poll_interval_ms": 20,
 *   "channels": [ { "name": "input", "kind": "input", "channel_id": 1,
 *                   "region_size": 4096, "notify_policy": "every_push" } ] }
 * @endcode
 */
class SystemConfig {
public:
    std::vector<ChannelConfig> channels;
    std::chrono::milliseconds pollInterval{20};

    static SystemConfig defaults();

    static std::expected<SystemConfig, ProtocolError> fromJson(const std::string& text,
                                                               const std::shared_ptr<spdlog::logger>& logger = nullptr);
    static std::expected<SystemConfig, ProtocolError> fromFile(const std::string& path,
                                                               const std::shared_ptr<spdlog::logger>& logger = nullptr);

    /// Consistency checks shared by every construction path.
    std::expected<void, ProtocolError> validate(const std::shared_ptr<spdlog::logger>& logger = nullptr) const;

    std::expected<ChannelConfig, ProtocolError> find(const std::string& name) const;

    nlohmann::json toJson() const;
};

} // namespace PDR
