#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <spdlog/logger.h>
#include "PDR/Error.h"
#include "Ring/core/SharedRegion.hpp"

namespace PDR {
namespace Ring {

constexpr uint32_t kMaxPhotoWidth  = 1920;
constexpr uint32_t kMaxPhotoHeight = 1080;
constexpr std::size_t kPixelBufferHeaderSize = 32;
constexpr std::size_t kPixelBufferRegionSize = 0x800000;   // 8 MiB

enum class PixelFormat : uint8_t {
    RGB24  = 0,
    RGBA32 = 1,
    RGB565 = 2
};

enum class BufferStatus : uint8_t {
    Empty   = 0,   // display released it, decoder may fill
    Loading = 1,   // decoder writing
    Ready   = 2,   // published, display owns it
    Error   = 3    // decoder gave up on this image
};

// --- POD Structures ---
struct alignas(32) PixelBufferHeader_POD {
    uint32_t width;          // 0x00
    uint32_t height;         // 0x04
    uint8_t  format;         // 0x08
    uint8_t  status;         // 0x09 - handshake flag
    uint16_t photoIndex;     // 0x0A
    uint32_t dataLen;        // 0x0C
    uint32_t checksum;       // 0x10
    uint8_t  reserved[12];   // 0x14
};
static_assert(sizeof(PixelBufferHeader_POD) == kPixelBufferHeaderSize);
static_assert(offsetof(PixelBufferHeader_POD, status) == 0x09);
static_assert(offsetof(PixelBufferHeader_POD, dataLen) == 0x0C);
static_assert(offsetof(PixelBufferHeader_POD, checksum) == 0x10);
static_assert(std::atomic<uint8_t>::is_always_lock_free);

inline std::atomic<uint8_t>& StatusProxy(PixelBufferHeader_POD& h) noexcept {
    return *reinterpret_cast<std::atomic<uint8_t>*>(&h.status);
}

std::expected<uint32_t, ProtocolError> bytesPerPixel(uint8_t rawFormat) noexcept;

/// Rolling checksum over the pixel bytes: sum = (sum + b) * 31, wrapping.
uint32_t computeChecksum(const uint8_t* data, std::size_t length) noexcept;

/**
 * @brief Byte offset of pixel (x, y) in an RGBA32 image.
 * @return Offset, or OutOfBounds / InvalidDimensions
 */
std::expected<uint32_t, ProtocolError> pixelOffsetRgba(uint32_t x, uint32_t y,
                                                       uint32_t width, uint32_t height) noexcept;

/// True when a srcW x srcH image fits inside dstW x dstH at (dstX, dstY).
bool validBlitParams(uint32_t srcW, uint32_t srcH,
                     uint32_t dstX, uint32_t dstY,
                     uint32_t dstW, uint32_t dstH) noexcept;

/// Trusted initializer: header zeroed, status Empty.
std::expected<void, ProtocolError> InitializePixelBuffer(const SharedRegion& region,
                                                         const std::shared_ptr<spdlog::logger>& logger = nullptr);

/**
 * @brief Decoder-side writer of the one-shot pixel buffer.
 *
 * begin() -> writeRow()* -> publish() (or fail()). The decoder is untrusted;
 * nothing here is relied upon by the reader.
 */
class PixelBufferWriter {
public:
    static std::expected<PixelBufferWriter, ProtocolError> attach(const SharedRegion& region,
                                                                  std::shared_ptr<spdlog::logger> logger = nullptr);

    /**
     * @brief Claim the buffer for a new image.
     *
     * @return BufferBusy while the display still holds a Ready image,
     *         InvalidDimensions / InvalidPixelFormat / RegionTooSmall for bad requests
     */
    std::expected<void, ProtocolError> begin(uint32_t width, uint32_t height,
                                             PixelFormat format, uint16_t photoIndex);

    /// Copy one row of pixel bytes; length must equal width * bpp.
    std::expected<void, ProtocolError> writeRow(uint32_t y, const uint8_t* bytes, std::size_t length);

    /// Compute the checksum and hand the buffer to the display.
    std::expected<void, ProtocolError> publish();

    /// Mark the current image as failed.
    void fail();

    BufferStatus status() const noexcept;

private:
    PixelBufferWriter(PixelBufferHeader_POD* header, uint8_t* pixels, std::size_t capacity,
                      std::shared_ptr<spdlog::logger> logger)
        : header_(header), pixels_(pixels), capacity_(capacity), logger_(std::move(logger)) {}

    PixelBufferHeader_POD* header_;
    uint8_t* pixels_;
    std::size_t capacity_;
    std::shared_ptr<spdlog::logger> logger_;

    bool loading_{false};
    uint32_t width_{0};
    uint32_t height_{0};
    uint32_t rowBytes_{0};
    uint32_t dataLen_{0};
};

// Read-only view of a validated image. Dimensions come from the validated
// header snapshot, not from shared memory.
struct PixelImageView {
    uint32_t width{0};
    uint32_t height{0};
    PixelFormat format{PixelFormat::RGBA32};
    uint16_t photoIndex{0};
    uint32_t checksum{0};
    const uint8_t* data{nullptr};
    std::size_t dataLen{0};
};

/**
 * @brief Display-side reader. Validates everything before exposing pixels.
 */
class PixelBufferReader {
public:
    static std::expected<PixelBufferReader, ProtocolError> attach(const SharedRegion& region,
                                                                  std::shared_ptr<spdlog::logger> logger = nullptr);

    /**
     * @brief Validate and expose the published image.
     *
     * Checks status, dimensions, format, data_len == w*h*bpp, region bounds and
     * checksum, in that order.
     *
     * @return View of the image, BufferNotReady if nothing is published, or the
     *         first validation failure. The buffer stays Ready either way; call
     *         release() to hand it back.
     */
    std::expected<PixelImageView, ProtocolError> acquire() const;

    /// Ready/Error -> Empty. Returns false and leaves the status alone otherwise.
    bool release();

    BufferStatus status() const noexcept;

private:
    PixelBufferReader(PixelBufferHeader_POD* header, const uint8_t* pixels, std::size_t capacity,
                      std::shared_ptr<spdlog::logger> logger)
        : header_(header), pixels_(pixels), capacity_(capacity), logger_(std::move(logger)) {}

    PixelBufferHeader_POD* header_;
    const uint8_t* pixels_;
    std::size_t capacity_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace Ring
} // namespace PDR
