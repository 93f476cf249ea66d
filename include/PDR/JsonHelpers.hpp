#pragma once
#include "PDR/Error.h"
#include "PDR/SystemConfig.hpp"
#include "Ring/core/ChannelStats.hpp"
#include "Ring/core/Doorbell.hpp"
#include "Ring/core/RingHeader.hpp"
#include <cstdint>
#include <expected>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace PDR::JsonHelpers {
    using json = nlohmann::json;

    std::string channelKindToString(ChannelKind kind);
    std::expected<ChannelKind, ProtocolError> channelKindFromString(const std::string& text);
    std::string notifyPolicyToString(Ring::NotifyPolicy policy);
    std::expected<Ring::NotifyPolicy, ProtocolError> notifyPolicyFromString(const std::string& text);
    std::string protocolErrorToString(ProtocolError error);

    json toJson(const Ring::ChannelStats& stats);
    json toJson(const Ring::RingSnapshot& snapshot);
    json toJson(const ChannelConfig& channel);
    json serializeHexBytes(const std::vector<uint8_t>& bytes);
}
