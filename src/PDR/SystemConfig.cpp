#include "PDR/SystemConfig.hpp"
#include "PDR/JsonHelpers.hpp"
#include "Ring/core/RingChannel.hpp"
#include "Ring/protocol/InputProtocol.hpp"
#include "Ring/protocol/NetProtocol.hpp"
#include "Ring/protocol/PhotoProtocol.hpp"
#include "Ring/protocol/PixelBuffer.hpp"
#include <fstream>
#include <set>
#include <sstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace PDR {

namespace {

constexpr std::size_t kPageSize = 0x1000;

std::size_t pageRounded(std::size_t bytes) {
    return Ring::alignUp(bytes, kPageSize);
}

ChannelConfig makeChannel(std::string name, ChannelKind kind, Ring::ChannelId id,
                          Ring::NotifyPolicy policy = Ring::NotifyPolicy::EveryPush) {
    ChannelConfig c;
    c.name = std::move(name);
    c.kind = kind;
    c.channelId = id;
    c.regionSize = pageRounded(requiredRegionBytes(kind));
    c.policy = policy;
    return c;
}

} // anonymous namespace

std::size_t requiredRegionBytes(ChannelKind kind) noexcept {
    using namespace Ring;
    switch (kind) {
        case ChannelKind::Input:
            return RingLayout<InputEntry, InputCodec::kCapacity>::kRegionBytes;
        case ChannelKind::NetTx:
        case ChannelKind::NetRx:
            return RingLayout<NetEntry, NetCodec::kCapacity>::kRegionBytes;
        case ChannelKind::NetStatus:
            return sizeof(LinkStatusBlock_POD);
        case ChannelKind::PhotoCommand:
            return RingLayout<PhotoCommandEntry, PhotoCommandCodec::kCapacity>::kRegionBytes;
        case ChannelKind::PixelBuffer:
            return kPixelBufferHeaderSize + std::size_t{kMaxPhotoWidth} * kMaxPhotoHeight * 4;
    }
    return 0;
}

SystemConfig SystemConfig::defaults() {
    using namespace Ring;
    SystemConfig config;
    config.channels.push_back(makeChannel("input", ChannelKind::Input, kInputChannelId));
    config.channels.push_back(makeChannel("decoder_pixels", ChannelKind::PixelBuffer, kDecoderChannelId));
    config.channels.back().regionSize = kPixelBufferRegionSize;
    config.channels.push_back(makeChannel("timer_commands", ChannelKind::PhotoCommand, kTimerChannelId));
    config.channels.push_back(makeChannel("display_commands", ChannelKind::PhotoCommand, kDisplayToDecoderChannelId));
    config.channels.push_back(makeChannel("net_tx", ChannelKind::NetTx, kNetTxChannelId));
    config.channels.push_back(makeChannel("net_rx", ChannelKind::NetRx, kNetRxChannelId,
                                          NotifyPolicy::OnEmptyTransition));
    config.channels.push_back(makeChannel("net_status", ChannelKind::NetStatus, kNetStatusChannelId));
    config.pollInterval = std::chrono::milliseconds(20);
    return config;
}

std::expected<void, ProtocolError> SystemConfig::validate(const std::shared_ptr<spdlog::logger>& logger) const {
    auto fail = [&logger](const std::string& why) -> std::expected<void, ProtocolError> {
        if (logger) logger->error("SystemConfig: {}", why);
        return std::unexpected(ProtocolError::InvalidConfig);
    };

    if (pollInterval.count() <= 0) return fail("poll interval must be positive");
    if (channels.empty()) return fail("no channels configured");

    std::set<std::string> names;
    std::set<Ring::ChannelId> ids;
    for (const auto& c : channels) {
        if (c.name.empty()) return fail("channel with empty name");
        if (!names.insert(c.name).second) return fail("duplicate channel name '" + c.name + "'");
        if (c.channelId > Ring::kMaxChannelId) {
            return fail("channel '" + c.name + "' id " + std::to_string(c.channelId) + " out of range");
        }
        if (!ids.insert(c.channelId).second) {
            return fail("duplicate channel id " + std::to_string(c.channelId));
        }
        const std::size_t needed = requiredRegionBytes(c.kind);
        if (c.regionSize < needed) {
            return fail("channel '" + c.name + "' region of " + std::to_string(c.regionSize) +
                        " bytes, needs " + std::to_string(needed));
        }
    }
    return {};
}

std::expected<SystemConfig, ProtocolError> SystemConfig::fromJson(const std::string& text,
                                                                  const std::shared_ptr<spdlog::logger>& logger) {
    SystemConfig config;
    try {
        const auto j = nlohmann::json::parse(text);

        if (j.contains("poll_interval_ms")) {
            config.pollInterval = std::chrono::milliseconds(j.at("poll_interval_ms").get<int64_t>());
        }

        for (const auto& item : j.at("channels")) {
            ChannelConfig c;
            c.name = item.at("name").get<std::string>();

            auto kind = JsonHelpers::channelKindFromString(item.at("kind").get<std::string>());
            if (!kind) {
                if (logger) logger->error("SystemConfig: channel '{}' has unknown kind '{}'",
                                          c.name, item.at("kind").get<std::string>());
                return std::unexpected(kind.error());
            }
            c.kind = *kind;

            const auto id = item.at("channel_id").get<int64_t>();
            if (id < 0 || id > static_cast<int64_t>(Ring::kMaxChannelId)) {
                if (logger) logger->error("SystemConfig: channel '{}' id {} out of range", c.name, id);
                return std::unexpected(ProtocolError::InvalidConfig);
            }
            c.channelId = static_cast<Ring::ChannelId>(id);

            c.regionSize = item.contains("region_size")
                ? item.at("region_size").get<std::size_t>()
                : pageRounded(requiredRegionBytes(c.kind));

            if (item.contains("notify_policy")) {
                auto policy = JsonHelpers::notifyPolicyFromString(item.at("notify_policy").get<std::string>());
                if (!policy) {
                    if (logger) logger->error("SystemConfig: channel '{}' has unknown notify policy", c.name);
                    return std::unexpected(policy.error());
                }
                c.policy = *policy;
            }
            config.channels.push_back(std::move(c));
        }
    } catch (const nlohmann::json::exception& e) {
        if (logger) logger->error("SystemConfig: malformed configuration: {}", e.what());
        return std::unexpected(ProtocolError::InvalidConfig);
    }

    if (auto ok = config.validate(logger); !ok) return std::unexpected(ok.error());
    if (logger) logger->info("SystemConfig: {} channels, poll every {} ms",
                             config.channels.size(), config.pollInterval.count());
    return config;
}

std::expected<SystemConfig, ProtocolError> SystemConfig::fromFile(const std::string& path,
                                                                  const std::shared_ptr<spdlog::logger>& logger) {
    std::ifstream in(path);
    if (!in) {
        if (logger) logger->error("SystemConfig: cannot open '{}'", path);
        return std::unexpected(ProtocolError::IOError);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return fromJson(buffer.str(), logger);
}

std::expected<ChannelConfig, ProtocolError> SystemConfig::find(const std::string& name) const {
    for (const auto& c : channels) {
        if (c.name == name) return c;
    }
    return std::unexpected(ProtocolError::NotFound);
}

nlohmann::json SystemConfig::toJson() const {
    nlohmann::json j;
    j["poll_interval_ms"] = pollInterval.count();
    j["channels"] = nlohmann::json::array();
    for (const auto& c : channels) {
        j["channels"].push_back(JsonHelpers::toJson(c));
    }
    return j;
}

} // namespace PDR
