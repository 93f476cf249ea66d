#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "Ring/adapters/EventConsumer.hpp"
#include "Ring/adapters/EventProducer.hpp"
#include "Ring/protocol/PhotoProtocol.hpp"
#include <spdlog/spdlog.h>
#include <memory>

using namespace PDR;
using namespace PDR::Ring;
using ::testing::Return;
using ::testing::NiceMock;
using ::testing::StrictMock;

class MockDoorbell : public IDoorbell {
public:
    MOCK_METHOD(void, notify, (), (override));
    MOCK_METHOD(ChannelId, channel, (), (const, override));
};

class EventAdapterTest : public ::testing::Test {
protected:
    using Layout = RingLayout<PhotoCommandEntry, kPhotoCommandRingCapacity>;

    void SetUp() override {
        logger_ = spdlog::default_logger();
        auto mapping = MappedRegion::create(Layout::kRegionBytes);
        ASSERT_TRUE(mapping.has_value());
        mapping_ = std::move(*mapping);
        ASSERT_TRUE((InitializeRing<PhotoCommandEntry, kPhotoCommandRingCapacity>(mapping_->region(), logger_))
                        .has_value());
        ON_CALL(doorbell_, channel()).WillByDefault(Return(kDisplayToDecoderChannelId));
    }

    std::unique_ptr<EventProducer<PhotoCommandCodec>> makeProducer(NotifyPolicy policy) {
        auto producer = EventProducer<PhotoCommandCodec>::attach(mapping_->region(), doorbell_, policy, logger_);
        if (!producer) return nullptr;
        return std::make_unique<EventProducer<PhotoCommandCodec>>(std::move(*producer));
    }

    std::unique_ptr<EventConsumer<PhotoCommandCodec>> makeConsumer() {
        auto consumer = EventConsumer<PhotoCommandCodec>::attach(mapping_->region(), logger_);
        if (!consumer) return nullptr;
        return std::make_unique<EventConsumer<PhotoCommandCodec>>(std::move(*consumer));
    }

    RingHeader_POD* header() {
        return *mapping_->region().at<RingHeader_POD>(0);
    }

    std::shared_ptr<spdlog::logger> logger_;
    std::unique_ptr<MappedRegion> mapping_;
    NiceMock<MockDoorbell> doorbell_;
};

TEST_F(EventAdapterTest, EveryPushRingsForEachEvent) {
    auto producer = makeProducer(NotifyPolicy::EveryPush);
    ASSERT_NE(producer, nullptr);

    EXPECT_CALL(doorbell_, notify()).Times(3);
    ASSERT_TRUE(producer->publish(PhotoCommand::next()).has_value());
    ASSERT_TRUE(producer->publish(PhotoCommand::next()).has_value());
    ASSERT_TRUE(producer->publish(PhotoCommand::prev()).has_value());
    EXPECT_EQ(producer->stats().notifications, 3u);
    EXPECT_EQ(producer->stats().pushed, 3u);
}

TEST_F(EventAdapterTest, EmptyTransitionRingsOnlyWhenConsumerCaughtUp) {
    auto producer = makeProducer(NotifyPolicy::OnEmptyTransition);
    auto consumer = makeConsumer();
    ASSERT_NE(producer, nullptr);
    ASSERT_NE(consumer, nullptr);

    EXPECT_CALL(doorbell_, notify()).Times(2);
    ASSERT_TRUE(producer->publish(PhotoCommand::gotoIndex(1)).has_value());
    ASSERT_TRUE(producer->publish(PhotoCommand::gotoIndex(2)).has_value());

    // Partial drain leaves the ring non-empty: still no new ring
    ASSERT_TRUE(consumer->drain([](const PhotoCommand&) {}, 1).has_value());
    ASSERT_TRUE(producer->publish(PhotoCommand::gotoIndex(3)).has_value());

    ASSERT_TRUE(consumer->drain([](const PhotoCommand&) {}).has_value());
    ASSERT_TRUE(producer->publish(PhotoCommand::gotoIndex(4)).has_value());
    EXPECT_EQ(producer->stats().notifications, 2u);
}

TEST_F(EventAdapterTest, EncoderRejectionPublishesNothing) {
    auto producer = makeProducer(NotifyPolicy::EveryPush);
    ASSERT_NE(producer, nullptr);

    EXPECT_CALL(doorbell_, notify()).Times(0);
    auto result = producer->publish(PhotoCommand{PhotoCommandType::Pause, 17});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), ProtocolError::InvalidField);
    EXPECT_EQ(producer->stats().encodeRejected, 1u);
    EXPECT_TRUE(producer->ring().isEmpty());
}

TEST_F(EventAdapterTest, FullRingDoesNotRing) {
    auto producer = makeProducer(NotifyPolicy::EveryPush);
    ASSERT_NE(producer, nullptr);

    EXPECT_CALL(doorbell_, notify()).Times(static_cast<int>(kPhotoCommandRingCapacity));
    for (std::size_t i = 0; i < kPhotoCommandRingCapacity; ++i) {
        ASSERT_TRUE(producer->publish(PhotoCommand::next()).has_value());
    }
    EXPECT_EQ(producer->publish(PhotoCommand::next()).error(), ProtocolError::ChannelFull);
    EXPECT_EQ(producer->stats().droppedFull, 1u);
}

TEST_F(EventAdapterTest, UninitializedChannelIsRetriedNotFaulted) {
    auto producer = makeProducer(NotifyPolicy::EveryPush);
    auto consumer = makeConsumer();
    ASSERT_NE(producer, nullptr);
    ASSERT_NE(consumer, nullptr);

    // Simulate the initializer not having run yet
    CapacityProxy(*header()).store(0, std::memory_order_release);

    EXPECT_CALL(doorbell_, notify()).Times(0);
    EXPECT_EQ(producer->publish(PhotoCommand::next()).error(), ProtocolError::ChannelNotReady);
    EXPECT_FALSE(producer->stats().poisoned);

    auto report = consumer->drain([](const PhotoCommand&) {});
    ASSERT_TRUE(report.has_value());
    EXPECT_TRUE(report->notReady);
    EXPECT_EQ(consumer->stats().notReadyPolls, 1u);
    EXPECT_FALSE(consumer->ring().poisoned());
}

TEST_F(EventAdapterTest, CorruptIndicesEndTheDrain) {
    auto producer = makeProducer(NotifyPolicy::EveryPush);
    auto consumer = makeConsumer();
    ASSERT_NE(producer, nullptr);
    ASSERT_NE(consumer, nullptr);

    ASSERT_TRUE(producer->publish(PhotoCommand::next()).has_value());
    // Producer claims more entries than the ring can hold
    WriteIndexProxy(*header()).store(kPhotoCommandRingCapacity + 5, std::memory_order_release);

    int delivered = 0;
    auto report = consumer->drain([&](const PhotoCommand&) { ++delivered; });
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error(), ProtocolError::IndexRangeViolation);
    EXPECT_EQ(delivered, 0);
    EXPECT_TRUE(consumer->stats().poisoned);
    EXPECT_EQ(consumer->stats().lastError, ProtocolError::IndexRangeViolation);

    // Sticky even after the header is repaired
    WriteIndexProxy(*header()).store(1, std::memory_order_release);
    auto again = consumer->drain([&](const PhotoCommand&) { ++delivered; });
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error(), ProtocolError::ChannelPoisoned);
    EXPECT_EQ(delivered, 0);
}

TEST_F(EventAdapterTest, DoorbellReportsItsChannel) {
    StrictMock<MockDoorbell> strict;
    EXPECT_CALL(strict, channel()).WillOnce(Return(kInputChannelId));
    EXPECT_CALL(strict, notify()).Times(1);

    auto producer = EventProducer<PhotoCommandCodec>::attach(mapping_->region(), strict);
    ASSERT_TRUE(producer.has_value());
    ASSERT_TRUE(producer->publish(PhotoCommand::resume()).has_value());
    EXPECT_EQ(strict.channel(), kInputChannelId);
}
