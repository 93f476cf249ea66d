#include "Ring/core/Doorbell.hpp"
#include <spdlog/spdlog.h>
#include <sys/eventfd.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>

namespace PDR {
namespace Ring {

std::expected<std::unique_ptr<NotificationEndpoint>, ProtocolError>
NotificationEndpoint::create(std::string name, std::shared_ptr<spdlog::logger> logger) {
    int fd = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
    if (fd < 0) {
        if (logger) logger->error("NotificationEndpoint '{}': eventfd failed: errno={}", name, errno);
        return std::unexpected(ProtocolError::IOError);
    }
    return std::unique_ptr<NotificationEndpoint>(new NotificationEndpoint(std::move(name), fd, std::move(logger)));
}

NotificationEndpoint::NotificationEndpoint(std::string name, int fd, std::shared_ptr<spdlog::logger> logger)
    : name_(std::move(name)), fd_(fd), logger_(std::move(logger)) {}

NotificationEndpoint::~NotificationEndpoint() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void NotificationEndpoint::signal(ChannelId id) noexcept {
    if (id > kMaxChannelId) {
        if (logger_) logger_->warn("NotificationEndpoint '{}': channel id {} out of range", name_, id);
        return;
    }
    // Bit first, then the kick: a waiter woken by the eventfd always finds it.
    pending_.fetch_or(uint64_t{1} << id, std::memory_order_release);
    const uint64_t one = 1;
    if (::write(fd_, &one, sizeof(one)) != static_cast<ssize_t>(sizeof(one))) {
        // EAGAIN means the counter is saturated, so the owner is woken anyway.
        if (errno != EAGAIN && logger_) {
            logger_->warn("NotificationEndpoint '{}': eventfd write failed: errno={}", name_, errno);
        }
    }
}

ChannelSet NotificationEndpoint::takePending() noexcept {
    uint64_t counter = 0;
    // Drain the kick counter; the badge word below is authoritative.
    while (::read(fd_, &counter, sizeof(counter)) == static_cast<ssize_t>(sizeof(counter))) {
    }
    return ChannelSet::fromBits(pending_.exchange(0, std::memory_order_acquire));
}

std::expected<ChannelSet, ProtocolError> NotificationEndpoint::wait(std::chrono::milliseconds timeout) {
    ChannelSet ready = takePending();
    if (!ready.empty()) return ready;

    struct pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    int rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (rc < 0) {
        if (errno == EINTR) return ChannelSet{};
        if (logger_) logger_->error("NotificationEndpoint '{}': poll failed: errno={}", name_, errno);
        return std::unexpected(ProtocolError::IOError);
    }
    return takePending();
}

} // namespace Ring
} // namespace PDR
