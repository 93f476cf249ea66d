/**
 * @file main.cpp
 * @brief Host simulation of the photo frame deployment: every protection
 *        domain runs as a thread, every memory region is a shared mapping.
 */

#include <iostream>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>
#include <fmt/format.h>
#include <atomic>
#include <chrono>
#include <charconv>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <map>
#include <optional>
#include <variant>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "PDR/DebugConsoleSink.hpp"
#include "PDR/Error.h"
#include "PDR/JsonHelpers.hpp"
#include "PDR/SystemConfig.hpp"
#include "Ring/DomainRuntime.hpp"
#include "Ring/adapters/EventConsumer.hpp"
#include "Ring/adapters/EventProducer.hpp"
#include "Ring/adapters/InputForwarder.hpp"
#include "Ring/core/Doorbell.hpp"
#include "Ring/core/RingChannel.hpp"
#include "Ring/core/SharedRegion.hpp"
#include "Ring/protocol/InputProtocol.hpp"
#include "Ring/protocol/NetProtocol.hpp"
#include "Ring/protocol/PhotoProtocol.hpp"
#include "Ring/protocol/PixelBuffer.hpp"

using namespace PDR;
using namespace PDR::Ring;

namespace {

std::atomic<bool> g_stop{false};

void signalHandler(int signal) {
    if (g_stop.exchange(true)) {
        std::exit(1);
    }
    spdlog::info("Caught signal {} - shutting down...", signal);
}

template<typename T>
T require(std::expected<T, ProtocolError> result, const std::string& what) {
    if (!result) {
        throw std::runtime_error(fmt::format("{}: {}", what, make_error_code(result.error()).message()));
    }
    return std::move(*result);
}

void require(std::expected<void, ProtocolError> result, const std::string& what) {
    if (!result) {
        throw std::runtime_error(fmt::format("{}: {}", what, make_error_code(result.error()).message()));
    }
}

template<typename Consumer, typename Fn>
DomainRuntime::ChannelHandler drainHandler(Consumer& consumer, Fn fn) {
    return [&consumer, fn]() -> std::expected<void, ProtocolError> {
        auto report = consumer.drain(fn);
        if (!report) return std::unexpected(report.error());
        return {};
    };
}

// Owns the mappings of every configured channel, as the system builder would.
class Deployment {
public:
    Deployment(const SystemConfig& config, std::shared_ptr<spdlog::logger> logger)
        : config_(config), logger_(std::move(logger)) {}

    void mapAndInitialize() {
        for (const auto& channel : config_.channels) {
            auto mapping = require(MappedRegion::create(channel.regionSize, logger_), "map " + channel.name);
            const SharedRegion region = mapping->region();

            switch (channel.kind) {
                case ChannelKind::Input:
                    require(InitializeRing<InputEntry, InputCodec::kCapacity>(region, logger_), channel.name);
                    break;
                case ChannelKind::NetTx:
                case ChannelKind::NetRx:
                    require(InitializeRing<NetEntry, NetCodec::kCapacity>(region, logger_), channel.name);
                    break;
                case ChannelKind::PhotoCommand:
                    require(InitializeRing<PhotoCommandEntry, PhotoCommandCodec::kCapacity>(region, logger_),
                            channel.name);
                    break;
                case ChannelKind::PixelBuffer:
                    require(InitializePixelBuffer(region, logger_), channel.name);
                    break;
                case ChannelKind::NetStatus:
                    // Fresh mappings are zero filled: sequence 0 means "no status yet".
                    break;
            }
            logger_->info("Mapped '{}' ({}, channel {}, {} bytes, {})", channel.name,
                          JsonHelpers::channelKindToString(channel.kind), channel.channelId,
                          channel.regionSize, JsonHelpers::notifyPolicyToString(channel.policy));
            regions_.emplace(channel.name, std::move(mapping));
        }
    }

    SharedRegion region(const std::string& name) const {
        auto it = regions_.find(name);
        if (it == regions_.end()) throw std::runtime_error("no region '" + name + "'");
        return it->second->region();
    }

    ChannelConfig channel(const std::string& name) const {
        return require(config_.find(name), "channel " + name);
    }

private:
    const SystemConfig& config_;
    std::shared_ptr<spdlog::logger> logger_;
    std::map<std::string, std::unique_ptr<MappedRegion>> regions_;
};

std::shared_ptr<spdlog::logger> makeLogger(const std::string& name,
                                           const std::shared_ptr<spdlog::sinks::sink>& sink,
                                           spdlog::level::level_enum level) {
    auto logger = std::make_shared<spdlog::logger>(name, sink);
    logger->set_level(level);
    return logger;
}

// Slideshow state held by the display domain.
struct Slideshow {
    uint16_t current{0};
    uint16_t count{8};
    bool paused{false};
    uint64_t shown{0};
    uint64_t rejected{0};

    uint16_t next() { current = static_cast<uint16_t>((current + 1) % count); return current; }
    uint16_t prev() { current = static_cast<uint16_t>((current + count - 1) % count); return current; }
};

void renderTestImage(PixelBufferWriter& writer, uint16_t photoIndex, const std::shared_ptr<spdlog::logger>& logger) {
    constexpr uint32_t kWidth = 320;
    constexpr uint32_t kHeight = 240;

    if (auto begun = writer.begin(kWidth, kHeight, PixelFormat::RGBA32, photoIndex); !begun) {
        logger->warn("Decoder: cannot start photo {}: {}", photoIndex, make_error_code(begun.error()).message());
        return;
    }
    std::vector<uint8_t> row(kWidth * 4);
    for (uint32_t y = 0; y < kHeight; ++y) {
        for (uint32_t x = 0; x < kWidth; ++x) {
            row[x * 4 + 0] = static_cast<uint8_t>(x * 255 / kWidth);
            row[x * 4 + 1] = static_cast<uint8_t>(y * 255 / kHeight);
            row[x * 4 + 2] = static_cast<uint8_t>(photoIndex * 32);
            row[x * 4 + 3] = 0xFF;
        }
        if (auto written = writer.writeRow(y, row.data(), row.size()); !written) {
            logger->error("Decoder: row {} rejected: {}", y, make_error_code(written.error()).message());
            writer.fail();
            return;
        }
    }
    if (auto published = writer.publish(); !published) {
        logger->error("Decoder: publish failed: {}", make_error_code(published.error()).message());
    }
}

std::vector<InputEvent> scriptedInput() {
    return {
        KeyEvent{KeyCode::Right, KeyState::Pressed, 0},
        KeyEvent{KeyCode::Right, KeyState::Released, 0},
        KeyEvent{KeyCode::Right, KeyState::Pressed, Modifier::kShift},
        KeyEvent{KeyCode::Right, KeyState::Released, Modifier::kShift},
        RemoteEvent{IrButton::Pause, KeyState::Pressed},
        RemoteEvent{IrButton::Pause, KeyState::Released},
        KeyEvent{KeyCode::Left, KeyState::Pressed, 0},
        KeyEvent{KeyCode::Left, KeyState::Released, 0},
        RemoteEvent{IrButton::Play, KeyState::Pressed},
        RemoteEvent{IrButton::Play, KeyState::Released},
        KeyEvent{KeyCode::Num5, KeyState::Pressed, 0},
        KeyEvent{KeyCode::Num5, KeyState::Released, 0},
    };
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::string configPath;
    int durationMs = 1500;
    auto level = spdlog::level::info;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--duration-ms" && i + 1 < argc) {
            const char* value = argv[++i];
            const char* end = value + std::strlen(value);
            auto [ptr, ec] = std::from_chars(value, end, durationMs);
            if (ec != std::errc{} || ptr != end || durationMs < 0) {
                std::cerr << "Invalid --duration-ms value: " << value << std::endl;
                return 1;
            }
        } else if (arg == "-v") {
            level = spdlog::level::debug;
        } else {
            configPath = arg;
        }
    }

    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        auto logger = makeLogger("system", console_sink, level);
        spdlog::set_default_logger(logger);
        spdlog::info("pdring_demo starting...");

        signal(SIGINT, signalHandler);
        signal(SIGTERM, signalHandler);

        SystemConfig config = configPath.empty()
            ? SystemConfig::defaults()
            : require(SystemConfig::fromFile(configPath, logger), "load " + configPath);
        require(config.validate(logger), "validate configuration");

        Deployment deployment(config, logger);
        deployment.mapAndInitialize();

        // Protection domains only have the kernel debug console.
        auto pd_console = std::make_shared<debug_console_sink_mt>();
        pd_console->set_pattern("[%H:%M:%S.%e] [%n] %l: %v");

        auto inputLog   = makeLogger("input_pd", pd_console, level);
        auto timerLog   = makeLogger("timer_pd", pd_console, level);
        auto displayLog = makeLogger("display_pd", pd_console, level);
        auto decoderLog = makeLogger("decoder_pd", pd_console, level);
        auto netLog     = makeLogger("net_pd", pd_console, level);
        auto clientLog  = makeLogger("net_client", pd_console, level);

        auto displayEp = require(NotificationEndpoint::create("display", displayLog), "display endpoint");
        auto decoderEp = require(NotificationEndpoint::create("decoder", decoderLog), "decoder endpoint");
        auto netEp     = require(NotificationEndpoint::create("net", netLog), "net endpoint");
        auto clientEp  = require(NotificationEndpoint::create("net_client", clientLog), "client endpoint");

        const auto inputCh   = deployment.channel("input");
        const auto timerCh   = deployment.channel("timer_commands");
        const auto pixelsCh  = deployment.channel("decoder_pixels");
        const auto dispCmdCh = deployment.channel("display_commands");
        const auto netTxCh   = deployment.channel("net_tx");
        const auto netRxCh   = deployment.channel("net_rx");
        const auto statusCh  = deployment.channel("net_status");

        EndpointDoorbell inputBell(*displayEp, inputCh.channelId);
        EndpointDoorbell timerBell(*displayEp, timerCh.channelId);
        EndpointDoorbell pixelsBell(*displayEp, pixelsCh.channelId);
        EndpointDoorbell dispCmdBell(*decoderEp, dispCmdCh.channelId);
        EndpointDoorbell netTxBell(*netEp, netTxCh.channelId);
        EndpointDoorbell netRxBell(*clientEp, netRxCh.channelId);
        EndpointDoorbell statusBell(*clientEp, statusCh.channelId);

        // --- Input domain ---
        auto inputProducer = require(EventProducer<InputCodec>::attach(
            deployment.region("input"), inputBell, inputCh.policy, inputLog), "input producer");
        InputForwarder forwarder(inputProducer, InputBackpressure::Coalesce, inputLog);

        // --- Timer domain ---
        auto timerProducer = require(EventProducer<PhotoCommandCodec>::attach(
            deployment.region("timer_commands"), timerBell, timerCh.policy, timerLog), "timer producer");

        // --- Display domain ---
        auto inputConsumer = require(EventConsumer<InputCodec>::attach(
            deployment.region("input"), displayLog), "input consumer");
        auto timerConsumer = require(EventConsumer<PhotoCommandCodec>::attach(
            deployment.region("timer_commands"), displayLog), "timer consumer");
        auto dispCmdProducer = require(EventProducer<PhotoCommandCodec>::attach(
            deployment.region("display_commands"), dispCmdBell, dispCmdCh.policy, displayLog), "display commands");
        auto pixelReader = require(PixelBufferReader::attach(deployment.region("decoder_pixels"), displayLog),
                                   "pixel reader");

        // --- Decoder domain ---
        auto dispCmdConsumer = require(EventConsumer<PhotoCommandCodec>::attach(
            deployment.region("display_commands"), decoderLog), "decoder commands");
        auto pixelWriter = require(PixelBufferWriter::attach(deployment.region("decoder_pixels"), decoderLog),
                                   "pixel writer");

        // --- Network domain and its client ---
        auto netTxConsumer = require(EventConsumer<NetCodec>::attach(deployment.region("net_tx"), netLog), "net tx");
        auto netRxProducer = require(EventProducer<NetCodec>::attach(
            deployment.region("net_rx"), netRxBell, netRxCh.policy, netLog), "net rx");
        auto statusWriter = require(LinkStatusWriter::attach(deployment.region("net_status"), netLog), "status");

        auto clientTx = require(EventProducer<NetCodec>::attach(
            deployment.region("net_tx"), netTxBell, netTxCh.policy, clientLog), "client tx");
        auto clientRx = require(EventConsumer<NetCodec>::attach(deployment.region("net_rx"), clientLog), "client rx");
        auto statusReader = require(LinkStatusReader::attach(deployment.region("net_status"), clientLog),
                                    "status reader");

        // Display: slideshow driven by input and timer, images from the decoder.
        Slideshow slideshow;
        DomainRuntime display("display", displayLog);
        auto requestPhoto = [&](uint16_t index) {
            if (auto sent = dispCmdProducer.publish(PhotoCommand::gotoIndex(index)); !sent) {
                displayLog->warn("Display: goto {} not sent: {}", index, make_error_code(sent.error()).message());
            }
        };
        require(display.registerHandler(inputCh.channelId, drainHandler(inputConsumer, [&](const InputEvent& ev) {
            bool pressed = false;
            bool forward = false, backward = false, toggle = false;
            if (const auto* key = std::get_if<KeyEvent>(&ev)) {
                pressed = key->state == KeyState::Pressed;
                forward = key->key == KeyCode::Right;
                backward = key->key == KeyCode::Left;
                toggle = key->key == KeyCode::Space;
            } else {
                const auto& remote = std::get<RemoteEvent>(ev);
                pressed = remote.state == KeyState::Pressed;
                forward = remote.button == IrButton::SkipNext || remote.button == IrButton::Right;
                backward = remote.button == IrButton::SkipPrev || remote.button == IrButton::Left;
                toggle = remote.button == IrButton::Pause || remote.button == IrButton::Play;
            }
            if (!pressed) return;
            if (forward) requestPhoto(slideshow.next());
            if (backward) requestPhoto(slideshow.prev());
            if (toggle) {
                slideshow.paused = !slideshow.paused;
                displayLog->info("Display: slideshow {}", slideshow.paused ? "paused" : "resumed");
            }
        })), "display input handler");
        require(display.registerHandler(timerCh.channelId, drainHandler(timerConsumer, [&](const PhotoCommand& cmd) {
            if (cmd.type == PhotoCommandType::Next && !slideshow.paused) requestPhoto(slideshow.next());
            if (cmd.type == PhotoCommandType::Prev && !slideshow.paused) requestPhoto(slideshow.prev());
            if (cmd.type == PhotoCommandType::Pause) slideshow.paused = true;
            if (cmd.type == PhotoCommandType::Resume) slideshow.paused = false;
        })), "display timer handler");
        require(display.registerHandler(pixelsCh.channelId, [&]() -> std::expected<void, ProtocolError> {
            auto image = pixelReader.acquire();
            if (!image) {
                if (image.error() == ProtocolError::BufferNotReady) return {};
                ++slideshow.rejected;
                if (!pixelReader.release()) displayLog->warn("Display: rejected image was not ours to release");
                return {};
            }
            ++slideshow.shown;
            displayLog->info("Display: showing photo {} ({}x{}, checksum 0x{:08x})",
                             image->photoIndex, image->width, image->height, image->checksum);
            if (!pixelReader.release()) displayLog->warn("Display: pixel buffer changed hands while shown");
            return {};
        }), "display pixel handler");

        // Decoder: renders the most recently requested photo once the buffer is free.
        std::optional<uint16_t> pendingPhoto;
        DomainRuntime decoder("decoder", decoderLog);
        require(decoder.registerHandler(dispCmdCh.channelId, [&]() -> std::expected<void, ProtocolError> {
            auto report = dispCmdConsumer.drain([&](const PhotoCommand& cmd) {
                if (cmd.type == PhotoCommandType::Goto) pendingPhoto = cmd.photoIndex;
            });
            if (!report) return std::unexpected(report.error());
            if (pendingPhoto && pixelWriter.status() != BufferStatus::Ready) {
                renderTestImage(pixelWriter, *pendingPhoto, decoderLog);
                pendingPhoto.reset();
                pixelsBell.notify();
            }
            return {};
        }), "decoder handler");

        // Network domain: loopback driver echoing every transmitted frame.
        DomainRuntime net("net", netLog);
        require(net.registerHandler(netTxCh.channelId, drainHandler(netTxConsumer, [&](const NetFrame& frame) {
            if (auto echoed = netRxProducer.publish(frame); !echoed) {
                netLog->warn("Net: echo dropped: {}", make_error_code(echoed.error()).message());
            }
        })), "net handler");

        uint64_t echoes = 0;
        DomainRuntime client("net_client", clientLog);
        require(client.registerHandler(netRxCh.channelId, drainHandler(clientRx, [&](const NetFrame& frame) {
            ++echoes;
            if (clientLog->should_log(spdlog::level::debug)) {
                clientLog->debug("Client: echo of {} bytes", frame.bytes.size());
            }
        })), "client rx handler");
        require(client.registerHandler(statusCh.channelId, [&]() -> std::expected<void, ProtocolError> {
            auto status = statusReader.read();
            if (!status) {
                if (status.error() == ProtocolError::ChannelNotReady) return {};
                return std::unexpected(status.error());
            }
            clientLog->info("Client: link {} {}", status->mac.toString(), status->up ? "up" : "down");
            return {};
        }), "client status handler");

        const auto interval = config.pollInterval;
        std::vector<std::thread> domains;
        auto runDomain = [&](DomainRuntime& runtime, NotificationEndpoint& endpoint) {
            if (auto ran = runtime.run(endpoint, g_stop, interval); !ran) {
                spdlog::critical("{} stopped: {}", runtime.name(), make_error_code(ran.error()).message());
                g_stop = true;
            }
        };
        domains.emplace_back([&] { runDomain(display, *displayEp); });
        domains.emplace_back([&] { runDomain(decoder, *decoderEp); });
        domains.emplace_back([&] { runDomain(net, *netEp); });
        domains.emplace_back([&] {
            for (uint8_t i = 0; i < 16; ++i) {
                NetFrame frame;
                frame.bytes.assign(60 + i, i);
                if (auto sent = clientTx.publish(frame); !sent) {
                    clientLog->warn("Client: frame {} not sent: {}", i, make_error_code(sent.error()).message());
                }
            }
            runDomain(client, *clientEp);
        });
        domains.emplace_back([&] {
            statusWriter.update(LinkStatus{MacAddress{{0xdc, 0xa6, 0x32, 0x00, 0x00, 0x01}},
                                           true, LinkSpeed::Mbps1000, true});
            statusBell.notify();
        });
        domains.emplace_back([&] {
            while (!g_stop.load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
                if (auto sent = timerProducer.publish(PhotoCommand::next()); !sent) {
                    timerLog->warn("Timer: tick dropped: {}", make_error_code(sent.error()).message());
                }
            }
        });
        domains.emplace_back([&] {
            for (const auto& event : scriptedInput()) {
                if (g_stop.load()) break;
                if (auto fwd = forwarder.forward(event); !fwd && fwd.error() != ProtocolError::ChannelFull) {
                    inputLog->warn("Input: event not forwarded: {}", make_error_code(fwd.error()).message());
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(40));
            }
            while (!g_stop.load() && forwarder.hasPending()) {
                if (!forwarder.flush()) std::this_thread::sleep_for(interval);
            }
        });

        const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(durationMs);
        while (!g_stop.load() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        g_stop = true;
        for (auto& t : domains) t.join();

        nlohmann::json report;
        report["config"] = config.toJson();
        report["input"] = { {"producer", JsonHelpers::toJson(inputProducer.stats())},
                            {"consumer", JsonHelpers::toJson(inputConsumer.stats())},
                            {"ring", JsonHelpers::toJson(inputConsumer.ring().snapshot())},
                            {"coalesced", forwarder.coalesced()} };
        report["timer_commands"] = { {"producer", JsonHelpers::toJson(timerProducer.stats())},
                                     {"consumer", JsonHelpers::toJson(timerConsumer.stats())} };
        report["display_commands"] = { {"producer", JsonHelpers::toJson(dispCmdProducer.stats())},
                                       {"consumer", JsonHelpers::toJson(dispCmdConsumer.stats())} };
        report["net_tx"] = { {"producer", JsonHelpers::toJson(clientTx.stats())},
                             {"consumer", JsonHelpers::toJson(netTxConsumer.stats())} };
        report["net_rx"] = { {"producer", JsonHelpers::toJson(netRxProducer.stats())},
                             {"consumer", JsonHelpers::toJson(clientRx.stats())},
                             {"echoes", echoes} };
        report["slideshow"] = { {"current", slideshow.current}, {"shown", slideshow.shown},
                                {"rejected", slideshow.rejected}, {"paused", slideshow.paused} };
        report["wakeups"] = { {"display", display.wakeups()}, {"decoder", decoder.wakeups()},
                              {"net", net.wakeups()}, {"net_client", client.wakeups()} };
        std::cout << report.dump(2) << std::endl;
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "An error occurred: " << ex.what() << std::endl;
        return 1;
    }

    spdlog::info("pdring_demo finished cleanly.");
    spdlog::default_logger()->flush();
    return 0;
}
