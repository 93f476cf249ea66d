#include "Ring/protocol/PixelBuffer.hpp"
#include <cstring>
#include <spdlog/spdlog.h>

namespace PDR {
namespace Ring {

std::expected<uint32_t, ProtocolError> bytesPerPixel(uint8_t rawFormat) noexcept {
    switch (rawFormat) {
        case static_cast<uint8_t>(PixelFormat::RGB24):  return 3u;
        case static_cast<uint8_t>(PixelFormat::RGBA32): return 4u;
        case static_cast<uint8_t>(PixelFormat::RGB565): return 2u;
        default: return std::unexpected(ProtocolError::InvalidPixelFormat);
    }
}

uint32_t computeChecksum(const uint8_t* data, std::size_t length) noexcept {
    uint32_t sum = 0;
    for (std::size_t i = 0; i < length; ++i) {
        sum = (sum + data[i]) * 31u;
    }
    return sum;
}

std::expected<uint32_t, ProtocolError> pixelOffsetRgba(uint32_t x, uint32_t y,
                                                       uint32_t width, uint32_t height) noexcept {
    if (width == 0 || height == 0 || width > kMaxPhotoWidth || height > kMaxPhotoHeight) {
        return std::unexpected(ProtocolError::InvalidDimensions);
    }
    if (x >= width || y >= height) {
        return std::unexpected(ProtocolError::OutOfBounds);
    }
    // Bounded by 1920 * 1080 * 4, well inside u32.
    return (y * width + x) * 4u;
}

bool validBlitParams(uint32_t srcW, uint32_t srcH,
                     uint32_t dstX, uint32_t dstY,
                     uint32_t dstW, uint32_t dstH) noexcept {
    if (srcW == 0 || srcH == 0 || dstW == 0 || dstH == 0) return false;
    if (dstX >= dstW || dstY >= dstH) return false;
    // 64-bit sums so a huge source width cannot wrap past the check.
    return uint64_t{dstX} + srcW <= dstW && uint64_t{dstY} + srcH <= dstH;
}

namespace {

struct PlacedBuffer {
    PixelBufferHeader_POD* header;
    uint8_t* pixels;
    std::size_t capacity;
};

std::expected<PlacedBuffer, ProtocolError> placeBuffer(const SharedRegion& region) {
    if (region.length() <= kPixelBufferHeaderSize) {
        return std::unexpected(ProtocolError::RegionTooSmall);
    }
    auto header = region.at<PixelBufferHeader_POD>(0);
    if (!header) return std::unexpected(header.error());
    auto pixels = region.at<uint8_t>(kPixelBufferHeaderSize, region.length() - kPixelBufferHeaderSize);
    if (!pixels) return std::unexpected(pixels.error());
    return PlacedBuffer{*header, *pixels, region.length() - kPixelBufferHeaderSize};
}

bool validDimensions(uint32_t width, uint32_t height) noexcept {
    return width > 0 && height > 0 && width <= kMaxPhotoWidth && height <= kMaxPhotoHeight;
}

} // anonymous namespace

std::expected<void, ProtocolError> InitializePixelBuffer(const SharedRegion& region,
                                                         const std::shared_ptr<spdlog::logger>& logger) {
    auto placed = placeBuffer(region);
    if (!placed) {
        if (logger) logger->error("InitializePixelBuffer: {}", make_error_code(placed.error()).message());
        return std::unexpected(placed.error());
    }
    PixelBufferHeader_POD& hdr = *placed->header;
    StatusProxy(hdr).store(static_cast<uint8_t>(BufferStatus::Empty), std::memory_order_relaxed);
    hdr.width = 0;
    hdr.height = 0;
    hdr.format = static_cast<uint8_t>(PixelFormat::RGBA32);
    hdr.photoIndex = 0;
    hdr.dataLen = 0;
    hdr.checksum = 0;
    std::memset(hdr.reserved, 0, sizeof(hdr.reserved));
    std::atomic_thread_fence(std::memory_order_release);
    if (logger) logger->debug("InitializePixelBuffer: {} bytes of pixel storage", placed->capacity);
    return {};
}

// --- Writer ---

std::expected<PixelBufferWriter, ProtocolError>
PixelBufferWriter::attach(const SharedRegion& region, std::shared_ptr<spdlog::logger> logger) {
    auto placed = placeBuffer(region);
    if (!placed) {
        if (logger) logger->error("PixelBufferWriter::attach: {}", make_error_code(placed.error()).message());
        return std::unexpected(placed.error());
    }
    return PixelBufferWriter(placed->header, placed->pixels, placed->capacity, std::move(logger));
}

BufferStatus PixelBufferWriter::status() const noexcept {
    return static_cast<BufferStatus>(StatusProxy(*header_).load(std::memory_order_acquire));
}

std::expected<void, ProtocolError> PixelBufferWriter::begin(uint32_t width, uint32_t height,
                                                            PixelFormat format, uint16_t photoIndex) {
    if (StatusProxy(*header_).load(std::memory_order_acquire) == static_cast<uint8_t>(BufferStatus::Ready)) {
        return std::unexpected(ProtocolError::BufferBusy);
    }
    if (!validDimensions(width, height)) {
        return std::unexpected(ProtocolError::InvalidDimensions);
    }
    auto bpp = bytesPerPixel(static_cast<uint8_t>(format));
    if (!bpp) return std::unexpected(bpp.error());

    const uint64_t dataLen = uint64_t{width} * height * *bpp;
    if (dataLen > capacity_) {
        if (logger_) logger_->error("PixelBufferWriter: {}x{} image needs {} bytes, buffer holds {}",
                                    width, height, dataLen, capacity_);
        return std::unexpected(ProtocolError::RegionTooSmall);
    }

    StatusProxy(*header_).store(static_cast<uint8_t>(BufferStatus::Loading), std::memory_order_release);
    header_->width = width;
    header_->height = height;
    header_->format = static_cast<uint8_t>(format);
    header_->photoIndex = photoIndex;
    header_->dataLen = static_cast<uint32_t>(dataLen);
    header_->checksum = 0;

    loading_ = true;
    width_ = width;
    height_ = height;
    rowBytes_ = width * *bpp;
    dataLen_ = static_cast<uint32_t>(dataLen);

    if (logger_) logger_->debug("PixelBufferWriter: loading photo {} ({}x{}, {} bytes)",
                                photoIndex, width, height, dataLen_);
    return {};
}

std::expected<void, ProtocolError> PixelBufferWriter::writeRow(uint32_t y, const uint8_t* bytes, std::size_t length) {
    if (!loading_) return std::unexpected(ProtocolError::BufferNotReady);
    if (y >= height_) return std::unexpected(ProtocolError::OutOfBounds);
    if (bytes == nullptr || length != rowBytes_) return std::unexpected(ProtocolError::LengthOutOfRange);

    std::memcpy(pixels_ + static_cast<std::size_t>(y) * rowBytes_, bytes, length);
    return {};
}

std::expected<void, ProtocolError> PixelBufferWriter::publish() {
    if (!loading_) return std::unexpected(ProtocolError::BufferNotReady);

    header_->checksum = computeChecksum(pixels_, dataLen_);
    StatusProxy(*header_).store(static_cast<uint8_t>(BufferStatus::Ready), std::memory_order_release);
    loading_ = false;

    if (logger_) logger_->debug("PixelBufferWriter: published photo {} checksum=0x{:08x}",
                                header_->photoIndex, header_->checksum);
    return {};
}

void PixelBufferWriter::fail() {
    StatusProxy(*header_).store(static_cast<uint8_t>(BufferStatus::Error), std::memory_order_release);
    loading_ = false;
    if (logger_) logger_->warn("PixelBufferWriter: image load failed");
}

// --- Reader ---

std::expected<PixelBufferReader, ProtocolError>
PixelBufferReader::attach(const SharedRegion& region, std::shared_ptr<spdlog::logger> logger) {
    auto placed = placeBuffer(region);
    if (!placed) {
        if (logger) logger->error("PixelBufferReader::attach: {}", make_error_code(placed.error()).message());
        return std::unexpected(placed.error());
    }
    return PixelBufferReader(placed->header, placed->pixels, placed->capacity, std::move(logger));
}

BufferStatus PixelBufferReader::status() const noexcept {
    return static_cast<BufferStatus>(StatusProxy(*header_).load(std::memory_order_acquire));
}

std::expected<PixelImageView, ProtocolError> PixelBufferReader::acquire() const {
    if (StatusProxy(*header_).load(std::memory_order_acquire) != static_cast<uint8_t>(BufferStatus::Ready)) {
        return std::unexpected(ProtocolError::BufferNotReady);
    }

    // Validate a private copy; the decoder may keep scribbling on the original.
    PixelBufferHeader_POD snapshot;
    std::memcpy(&snapshot, header_, sizeof(snapshot));

    auto reject = [this](ProtocolError error) -> std::expected<PixelImageView, ProtocolError> {
        if (logger_) logger_->warn("PixelBufferReader: rejected image: {}", make_error_code(error).message());
        return std::unexpected(error);
    };

    if (!validDimensions(snapshot.width, snapshot.height)) {
        return reject(ProtocolError::InvalidDimensions);
    }
    auto bpp = bytesPerPixel(snapshot.format);
    if (!bpp) return reject(bpp.error());

    const uint64_t wantLen = uint64_t{snapshot.width} * snapshot.height * *bpp;
    if (snapshot.dataLen != wantLen) return reject(ProtocolError::LengthOutOfRange);
    if (snapshot.dataLen > capacity_) return reject(ProtocolError::OutOfBounds);

    const uint32_t sum = computeChecksum(pixels_, snapshot.dataLen);
    if (sum != snapshot.checksum) {
        if (logger_) logger_->warn("PixelBufferReader: checksum 0x{:08x} != published 0x{:08x}",
                                   sum, snapshot.checksum);
        return std::unexpected(ProtocolError::ChecksumMismatch);
    }

    PixelImageView view;
    view.width = snapshot.width;
    view.height = snapshot.height;
    view.format = static_cast<PixelFormat>(snapshot.format);
    view.photoIndex = snapshot.photoIndex;
    view.checksum = snapshot.checksum;
    view.data = pixels_;
    view.dataLen = snapshot.dataLen;
    return view;
}

bool PixelBufferReader::release() {
    auto& status = StatusProxy(*header_);
    uint8_t current = status.load(std::memory_order_acquire);
    if (current != static_cast<uint8_t>(BufferStatus::Ready) &&
        current != static_cast<uint8_t>(BufferStatus::Error)) {
        if (logger_) logger_->debug("PixelBufferReader::release: buffer not owned by display (status={})", current);
        return false;
    }
    return status.compare_exchange_strong(current, static_cast<uint8_t>(BufferStatus::Empty),
                                          std::memory_order_acq_rel, std::memory_order_acquire);
}

} // namespace Ring
} // namespace PDR
