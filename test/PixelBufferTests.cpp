#include <gtest/gtest.h>
#include "Ring/protocol/PixelBuffer.hpp"
#include <cstdint>
#include <memory>
#include <vector>

using namespace PDR;
using namespace PDR::Ring;

TEST(PixelMathTest, BytesPerPixel) {
    EXPECT_EQ(*bytesPerPixel(0), 3u);
    EXPECT_EQ(*bytesPerPixel(1), 4u);
    EXPECT_EQ(*bytesPerPixel(2), 2u);
    EXPECT_EQ(bytesPerPixel(3).error(), ProtocolError::InvalidPixelFormat);
}

TEST(PixelMathTest, ChecksumMatchesReferenceValues) {
    EXPECT_EQ(computeChecksum(nullptr, 0), 0u);
    const uint8_t one[] = {1};
    EXPECT_EQ(computeChecksum(one, 1), 31u);
    const uint8_t two[] = {1, 2};
    EXPECT_EQ(computeChecksum(two, 2), (31u + 2u) * 31u);
    // Order matters
    const uint8_t swapped[] = {2, 1};
    EXPECT_NE(computeChecksum(two, 2), computeChecksum(swapped, 2));
}

TEST(PixelMathTest, PixelOffsetRgba) {
    EXPECT_EQ(*pixelOffsetRgba(0, 0, 10, 10), 0u);
    EXPECT_EQ(*pixelOffsetRgba(3, 2, 10, 10), (2u * 10u + 3u) * 4u);
    EXPECT_EQ(*pixelOffsetRgba(1919, 1079, 1920, 1080), (1079u * 1920u + 1919u) * 4u);
    EXPECT_EQ(pixelOffsetRgba(10, 0, 10, 10).error(), ProtocolError::OutOfBounds);
    EXPECT_EQ(pixelOffsetRgba(0, 10, 10, 10).error(), ProtocolError::OutOfBounds);
    EXPECT_EQ(pixelOffsetRgba(0, 0, 0, 10).error(), ProtocolError::InvalidDimensions);
    EXPECT_EQ(pixelOffsetRgba(0, 0, 1921, 10).error(), ProtocolError::InvalidDimensions);
}

TEST(PixelMathTest, BlitParams) {
    EXPECT_TRUE(validBlitParams(100, 100, 0, 0, 100, 100));
    EXPECT_TRUE(validBlitParams(50, 50, 50, 50, 100, 100));
    EXPECT_FALSE(validBlitParams(51, 50, 50, 50, 100, 100));
    EXPECT_FALSE(validBlitParams(10, 10, 100, 0, 100, 100));
    EXPECT_FALSE(validBlitParams(0, 10, 0, 0, 100, 100));
    EXPECT_FALSE(validBlitParams(0xFFFFFFFFu, 1, 1, 0, 100, 100));
}

// --- Handshake ---

class PixelBufferTest : public ::testing::Test {
protected:
    // Room for a 64x64 RGBA image and nothing more
    static constexpr std::size_t kRegionBytes = kPixelBufferHeaderSize + 64 * 64 * 4;

    void SetUp() override {
        auto mapping = MappedRegion::create(kRegionBytes);
        ASSERT_TRUE(mapping.has_value());
        mapping_ = std::move(*mapping);
        ASSERT_TRUE(InitializePixelBuffer(mapping_->region()).has_value());

        auto writer = PixelBufferWriter::attach(mapping_->region());
        auto reader = PixelBufferReader::attach(mapping_->region());
        ASSERT_TRUE(writer.has_value());
        ASSERT_TRUE(reader.has_value());
        writer_ = std::make_unique<PixelBufferWriter>(std::move(*writer));
        reader_ = std::make_unique<PixelBufferReader>(std::move(*reader));
    }

    PixelBufferHeader_POD* header() {
        return *mapping_->region().at<PixelBufferHeader_POD>(0);
    }

    void writeGradient(uint32_t width, uint32_t height) {
        std::vector<uint8_t> row(width * 4);
        for (uint32_t y = 0; y < height; ++y) {
            for (uint32_t x = 0; x < width; ++x) {
                row[x * 4 + 0] = static_cast<uint8_t>(x);
                row[x * 4 + 1] = static_cast<uint8_t>(y);
                row[x * 4 + 2] = static_cast<uint8_t>(x ^ y);
                row[x * 4 + 3] = 0xFF;
            }
            ASSERT_TRUE(writer_->writeRow(y, row.data(), row.size()).has_value());
        }
    }

    std::unique_ptr<MappedRegion> mapping_;
    std::unique_ptr<PixelBufferWriter> writer_;
    std::unique_ptr<PixelBufferReader> reader_;
};

TEST_F(PixelBufferTest, StartsEmpty) {
    EXPECT_EQ(reader_->status(), BufferStatus::Empty);
    EXPECT_EQ(reader_->acquire().error(), ProtocolError::BufferNotReady);
}

TEST_F(PixelBufferTest, PublishAcquireRelease) {
    ASSERT_TRUE(writer_->begin(32, 16, PixelFormat::RGBA32, 5).has_value());
    EXPECT_EQ(reader_->status(), BufferStatus::Loading);
    EXPECT_EQ(reader_->acquire().error(), ProtocolError::BufferNotReady);

    writeGradient(32, 16);
    ASSERT_TRUE(writer_->publish().has_value());
    EXPECT_EQ(writer_->status(), BufferStatus::Ready);

    auto view = reader_->acquire();
    ASSERT_TRUE(view.has_value());
    EXPECT_EQ(view->width, 32u);
    EXPECT_EQ(view->height, 16u);
    EXPECT_EQ(view->format, PixelFormat::RGBA32);
    EXPECT_EQ(view->photoIndex, 5);
    EXPECT_EQ(view->dataLen, 32u * 16u * 4u);
    EXPECT_EQ(view->checksum, computeChecksum(view->data, view->dataLen));

    auto offset = pixelOffsetRgba(3, 2, view->width, view->height);
    ASSERT_TRUE(offset.has_value());
    EXPECT_EQ(view->data[*offset + 0], 3);
    EXPECT_EQ(view->data[*offset + 1], 2);

    // Decoder cannot start the next image until the display lets go
    EXPECT_EQ(writer_->begin(8, 8, PixelFormat::RGB24, 6).error(), ProtocolError::BufferBusy);
    EXPECT_TRUE(reader_->release());
    EXPECT_EQ(writer_->status(), BufferStatus::Empty);
    EXPECT_TRUE(writer_->begin(8, 8, PixelFormat::RGB24, 6).has_value());
}

TEST_F(PixelBufferTest, TamperedPixelsFailChecksum) {
    ASSERT_TRUE(writer_->begin(16, 16, PixelFormat::RGBA32, 1).has_value());
    writeGradient(16, 16);
    ASSERT_TRUE(writer_->publish().has_value());

    auto pixels = mapping_->region().at<uint8_t>(kPixelBufferHeaderSize, 16);
    ASSERT_TRUE(pixels.has_value());
    (*pixels)[7] ^= 0x5A;

    EXPECT_EQ(reader_->acquire().error(), ProtocolError::ChecksumMismatch);
    // Rejection leaves the buffer with the reader
    EXPECT_EQ(reader_->status(), BufferStatus::Ready);
    EXPECT_TRUE(reader_->release());
    EXPECT_EQ(reader_->status(), BufferStatus::Empty);
}

TEST_F(PixelBufferTest, ReaderRejectsForgedHeaders) {
    ASSERT_TRUE(writer_->begin(16, 16, PixelFormat::RGBA32, 1).has_value());
    writeGradient(16, 16);
    ASSERT_TRUE(writer_->publish().has_value());
    PixelBufferHeader_POD good = *header();

    header()->dataLen = good.dataLen - 1;
    EXPECT_EQ(reader_->acquire().error(), ProtocolError::LengthOutOfRange);

    *header() = good;
    header()->width = 1921;
    EXPECT_EQ(reader_->acquire().error(), ProtocolError::InvalidDimensions);

    *header() = good;
    header()->format = 7;
    EXPECT_EQ(reader_->acquire().error(), ProtocolError::InvalidPixelFormat);

    // Self-consistent header whose data would run past the region
    *header() = good;
    header()->width = 1920;
    header()->height = 1080;
    header()->dataLen = 1920u * 1080u * 4u;
    EXPECT_EQ(reader_->acquire().error(), ProtocolError::OutOfBounds);

    *header() = good;
    EXPECT_TRUE(reader_->acquire().has_value());
}

TEST_F(PixelBufferTest, WriterRejectsBadRequests) {
    EXPECT_EQ(writer_->begin(0, 10, PixelFormat::RGBA32, 0).error(), ProtocolError::InvalidDimensions);
    EXPECT_EQ(writer_->begin(10, 1081, PixelFormat::RGBA32, 0).error(), ProtocolError::InvalidDimensions);
    EXPECT_EQ(writer_->begin(10, 10, static_cast<PixelFormat>(9), 0).error(), ProtocolError::InvalidPixelFormat);
    EXPECT_EQ(writer_->begin(128, 128, PixelFormat::RGBA32, 0).error(), ProtocolError::RegionTooSmall);

    const uint8_t row[4] = {};
    EXPECT_EQ(writer_->writeRow(0, row, sizeof(row)).error(), ProtocolError::BufferNotReady);
    EXPECT_EQ(writer_->publish().error(), ProtocolError::BufferNotReady);

    ASSERT_TRUE(writer_->begin(1, 2, PixelFormat::RGBA32, 0).has_value());
    EXPECT_EQ(writer_->writeRow(2, row, sizeof(row)).error(), ProtocolError::OutOfBounds);
    EXPECT_EQ(writer_->writeRow(0, row, 3).error(), ProtocolError::LengthOutOfRange);
    EXPECT_TRUE(writer_->writeRow(1, row, sizeof(row)).has_value());
}

TEST_F(PixelBufferTest, FailedLoadIsReportedAndReleasable) {
    ASSERT_TRUE(writer_->begin(4, 4, PixelFormat::RGB565, 9).has_value());
    writer_->fail();
    EXPECT_EQ(reader_->status(), BufferStatus::Error);
    EXPECT_EQ(reader_->acquire().error(), ProtocolError::BufferNotReady);
    EXPECT_TRUE(reader_->release());
    EXPECT_TRUE(writer_->begin(4, 4, PixelFormat::RGB565, 10).has_value());
}

TEST_F(PixelBufferTest, ReleaseLeavesDecoderClaimAlone) {
    EXPECT_FALSE(reader_->release());
    EXPECT_EQ(reader_->status(), BufferStatus::Empty);

    ASSERT_TRUE(writer_->begin(8, 8, PixelFormat::RGBA32, 2).has_value());
    EXPECT_FALSE(reader_->release());
    EXPECT_EQ(reader_->status(), BufferStatus::Loading);

    writeGradient(8, 8);
    ASSERT_TRUE(writer_->publish().has_value());
    EXPECT_TRUE(reader_->acquire().has_value());
}

TEST(PixelBufferAttachTest, HeaderOnlyRegionIsTooSmall) {
    auto mapping = MappedRegion::create(kPixelBufferHeaderSize);
    ASSERT_TRUE(mapping.has_value());
    EXPECT_EQ(PixelBufferWriter::attach((*mapping)->region()).error(), ProtocolError::RegionTooSmall);
    EXPECT_EQ(PixelBufferReader::attach((*mapping)->region()).error(), ProtocolError::RegionTooSmall);
}
