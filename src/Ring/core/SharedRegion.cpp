#include "Ring/core/SharedRegion.hpp"
#include <spdlog/spdlog.h>
#include <sys/mman.h>
#include <cerrno>

namespace PDR {
namespace Ring {

std::expected<std::unique_ptr<MappedRegion>, ProtocolError>
MappedRegion::create(size_t length, std::shared_ptr<spdlog::logger> logger) {
    if (length == 0) {
        if (logger) logger->error("MappedRegion::create: zero length");
        return std::unexpected(ProtocolError::RegionTooSmall);
    }

    void* ptr = ::mmap(nullptr, length, PROT_READ | PROT_WRITE, MAP_SHARED | MAP_ANONYMOUS, -1, 0);
    if (ptr == MAP_FAILED) {
        if (logger) logger->error("MappedRegion::create: mmap of {} bytes failed: errno={}", length, errno);
        return std::unexpected(ProtocolError::IOError);
    }

    if (logger) logger->debug("MappedRegion::create: mapped {} bytes at {}", length, ptr);
    return std::unique_ptr<MappedRegion>(new MappedRegion(ptr, length, std::move(logger)));
}

MappedRegion::MappedRegion(void* base, size_t length, std::shared_ptr<spdlog::logger> logger)
    : base_(base), length_(length), logger_(std::move(logger)) {}

MappedRegion::~MappedRegion() {
    if (base_) {
        if (::munmap(base_, length_) != 0 && logger_) {
            logger_->warn("MappedRegion: munmap failed: errno={}", errno);
        }
        base_ = nullptr;
    }
}

} // namespace Ring
} // namespace PDR
