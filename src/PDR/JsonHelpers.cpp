#include "PDR/JsonHelpers.hpp"
#include <nlohmann/json.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace PDR::JsonHelpers {
    std::string channelKindToString(ChannelKind kind) {
        switch (kind) {
            case ChannelKind::Input: return "input";
            case ChannelKind::NetTx: return "net_tx";
            case ChannelKind::NetRx: return "net_rx";
            case ChannelKind::NetStatus: return "net_status";
            case ChannelKind::PhotoCommand: return "photo_command";
            case ChannelKind::PixelBuffer: return "pixel_buffer";
            default: return "unknown";
        }
    }
    std::expected<ChannelKind, ProtocolError> channelKindFromString(const std::string& text) {
        if (text == "input") return ChannelKind::Input;
        if (text == "net_tx") return ChannelKind::NetTx;
        if (text == "net_rx") return ChannelKind::NetRx;
        if (text == "net_status") return ChannelKind::NetStatus;
        if (text == "photo_command") return ChannelKind::PhotoCommand;
        if (text == "pixel_buffer") return ChannelKind::PixelBuffer;
        return std::unexpected(ProtocolError::InvalidConfig);
    }
    std::string notifyPolicyToString(Ring::NotifyPolicy policy) {
        return (policy == Ring::NotifyPolicy::EveryPush) ? "every_push" : "on_empty_transition";
    }
    std::expected<Ring::NotifyPolicy, ProtocolError> notifyPolicyFromString(const std::string& text) {
        if (text == "every_push") return Ring::NotifyPolicy::EveryPush;
        if (text == "on_empty_transition") return Ring::NotifyPolicy::OnEmptyTransition;
        return std::unexpected(ProtocolError::InvalidConfig);
    }
    std::string protocolErrorToString(ProtocolError error) {
        return fmt::format("{} (0x{:03x})", make_error_code(error).message(), static_cast<int>(error));
    }
    json toJson(const Ring::ChannelStats& stats) {
        json j;
        j["pushed"] = stats.pushed;
        j["dropped_full"] = stats.droppedFull;
        j["encode_rejected"] = stats.encodeRejected;
        j["notifications"] = stats.notifications;
        j["popped"] = stats.popped;
        j["decoded"] = stats.decoded;
        j["corrupt"] = stats.corrupt;
        j["not_ready_polls"] = stats.notReadyPolls;
        j["drains"] = stats.drains;
        j["poisoned"] = stats.poisoned;
        j["last_error"] = stats.lastError ? json(protocolErrorToString(*stats.lastError)) : json(nullptr);
        j["last_corrupt_entry"] = serializeHexBytes(stats.lastCorruptEntry);
        return j;
    }
    json toJson(const Ring::RingSnapshot& snapshot) {
        json j;
        j["capacity"] = snapshot.capacity;
        j["entry_size"] = snapshot.entrySize;
        j["abi_version"] = snapshot.abiVersion;
        j["write_index"] = snapshot.writeIndex;
        j["read_index"] = snapshot.readIndex;
        j["occupancy"] = snapshot.occupancy();
        return j;
    }
    json toJson(const ChannelConfig& channel) {
        json j;
        j["name"] = channel.name;
        j["kind"] = channelKindToString(channel.kind);
        j["channel_id"] = channel.channelId;
        j["region_size"] = channel.regionSize;
        j["notify_policy"] = notifyPolicyToString(channel.policy);
        return j;
    }
    // Contiguous uppercase hex, null for an empty dump.
    json serializeHexBytes(const std::vector<uint8_t>& bytes) {
        if (bytes.empty()) return nullptr;
        return fmt::format("{:02X}", fmt::join(bytes, ""));
    }
}
