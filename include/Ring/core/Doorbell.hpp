#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <initializer_list>
#include <memory>
#include <string>
#include <spdlog/logger.h>
#include "PDR/Error.h"
#include "Ring/interfaces/IDoorbell.hpp"

namespace PDR {
namespace Ring {

// Channel ids as wired in the system description.
constexpr ChannelId kInputChannelId            = 1;
constexpr ChannelId kDecoderChannelId          = 2;
constexpr ChannelId kTimerChannelId            = 3;
constexpr ChannelId kDisplayToDecoderChannelId = 4;
constexpr ChannelId kNetTxChannelId            = 5;
constexpr ChannelId kNetRxChannelId            = 6;
constexpr ChannelId kNetStatusChannelId        = 7;

constexpr ChannelId kMaxChannelId = 62;

enum class NotifyPolicy : uint8_t {
    EveryPush,          // ring the doorbell after every successful push
    OnEmptyTransition   // only when the push took the ring from empty to non-empty
};

/**
 * @brief Set of channel ids delivered by one wakeup (a badge word).
 */
class ChannelSet {
public:
    ChannelSet() = default;
    ChannelSet(std::initializer_list<ChannelId> ids) noexcept {
        for (ChannelId id : ids) add(id);
    }
    static ChannelSet fromBits(uint64_t bits) noexcept { ChannelSet s; s.bits_ = bits; return s; }

    void add(ChannelId id) noexcept {
        if (id <= kMaxChannelId) bits_ |= (uint64_t{1} << id);
    }
    bool contains(ChannelId id) const noexcept {
        return id <= kMaxChannelId && (bits_ & (uint64_t{1} << id)) != 0;
    }
    bool empty() const noexcept { return bits_ == 0; }
    uint64_t bits() const noexcept { return bits_; }

    template<typename Fn>
    void forEach(Fn&& fn) const {
        for (ChannelId id = 0; id <= kMaxChannelId; ++id) {
            if (contains(id)) fn(id);
        }
    }

    bool operator==(const ChannelSet&) const = default;

private:
    uint64_t bits_{0};
};

/**
 * @brief Notification object of one protection domain.
 *
 * Peers set a channel bit and kick an eventfd; the owning domain collects all
 * pending bits in one wait(). Signals raised while the owner is busy coalesce
 * into the next wait.
 */
class NotificationEndpoint {
public:
    static std::expected<std::unique_ptr<NotificationEndpoint>, ProtocolError>
    create(std::string name, std::shared_ptr<spdlog::logger> logger = nullptr);

    ~NotificationEndpoint();

    // Prevent copying
    NotificationEndpoint(const NotificationEndpoint&) = delete;
    NotificationEndpoint& operator=(const NotificationEndpoint&) = delete;

    void signal(ChannelId id) noexcept;

    /**
     * @brief Block until at least one channel is signalled or the timeout expires.
     *
     * @return Channels signalled since the previous wait (empty on timeout)
     */
    std::expected<ChannelSet, ProtocolError> wait(std::chrono::milliseconds timeout);

    /// Non-blocking variant of wait().
    ChannelSet takePending() noexcept;

    const std::string& name() const noexcept { return name_; }
    int fd() const noexcept { return fd_; }

private:
    NotificationEndpoint(std::string name, int fd, std::shared_ptr<spdlog::logger> logger);

    std::string name_;
    int fd_{-1};
    std::atomic<uint64_t> pending_{0};
    std::shared_ptr<spdlog::logger> logger_;
};

// Doorbell that signals one channel bit on a peer's endpoint.
class EndpointDoorbell : public IDoorbell {
public:
    EndpointDoorbell(NotificationEndpoint& peer, ChannelId id) noexcept : peer_(peer), id_(id) {}

    void notify() override { peer_.signal(id_); }
    ChannelId channel() const override { return id_; }

private:
    NotificationEndpoint& peer_;
    ChannelId id_;
};

// Doorbell backed by a plain callback; used for in-process wiring and tests.
class CallbackDoorbell : public IDoorbell {
public:
    CallbackDoorbell(ChannelId id, std::function<void(ChannelId)> callback)
        : id_(id), callback_(std::move(callback)) {}

    void notify() override {
        if (callback_) callback_(id_);
    }
    ChannelId channel() const override { return id_; }

private:
    ChannelId id_;
    std::function<void(ChannelId)> callback_;
};

} // namespace Ring
} // namespace PDR
