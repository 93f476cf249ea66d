#include <gtest/gtest.h>
#include "Ring/core/RingChannel.hpp"
#include "Ring/core/RingHeader.hpp"
#include "Ring/core/SharedRegion.hpp"
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <vector>

using namespace PDR;
using namespace PDR::Ring;

namespace {

struct TestEntry {
    uint64_t seq;
    uint32_t tag;
    uint32_t pad;
};

constexpr std::size_t kSmallCapacity = 4;
using SmallLayout = RingLayout<TestEntry, kSmallCapacity>;
using SmallProducer = RingProducer<TestEntry, kSmallCapacity>;
using SmallConsumer = RingConsumer<TestEntry, kSmallCapacity>;

TestEntry entry(uint64_t seq) { return TestEntry{seq, static_cast<uint32_t>(seq * 7), 0}; }

} // anonymous namespace

class RingChannelTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto mapping = MappedRegion::create(SmallLayout::kRegionBytes);
        ASSERT_TRUE(mapping.has_value());
        mapping_ = std::move(*mapping);
        ASSERT_TRUE((InitializeRing<TestEntry, kSmallCapacity>(mapping_->region())).has_value());

        auto producer = SmallProducer::attach(mapping_->region());
        auto consumer = SmallConsumer::attach(mapping_->region());
        ASSERT_TRUE(producer.has_value());
        ASSERT_TRUE(consumer.has_value());
        producer_ = std::make_unique<SmallProducer>(std::move(*producer));
        consumer_ = std::make_unique<SmallConsumer>(std::move(*consumer));
    }

    RingHeader_POD& header() { return **mapping_->region().at<RingHeader_POD>(0); }

    // Place both counters at an arbitrary point, as if the ring had run that long.
    void setIndices(uint64_t w, uint64_t r) {
        WriteIndexProxy(header()).store(w);
        ReadIndexProxy(header()).store(r);
    }

    std::vector<std::byte> regionBytes() const {
        const SharedRegion region = mapping_->region();
        return std::vector<std::byte>(region.base(), region.base() + region.length());
    }

    std::unique_ptr<MappedRegion> mapping_;
    std::unique_ptr<SmallProducer> producer_;
    std::unique_ptr<SmallConsumer> consumer_;
};

TEST(RingLayoutTest, HeaderOffsetsAndEntryPlacement) {
    EXPECT_EQ(sizeof(RingHeader_POD), 32u);
    EXPECT_EQ(SmallLayout::kEntriesOffset, 32u);
    EXPECT_EQ(SmallLayout::kRegionBytes, 32u + 4 * sizeof(TestEntry));
    EXPECT_EQ(slotFor<4>(0), 0u);
    EXPECT_EQ(slotFor<4>(5), 1u);
    EXPECT_EQ(slotFor<4>(std::numeric_limits<uint64_t>::max()), 3u);
}

TEST(RingLayoutTest, OccupancyUsesWrappingSubtraction) {
    EXPECT_EQ(occupancyOf(10, 7), 3u);
    EXPECT_EQ(occupancyOf(1, std::numeric_limits<uint64_t>::max()), 2u);
    // A reader ahead of the writer shows up as a huge occupancy.
    EXPECT_GT(occupancyOf(3, 5), 4u);
}

TEST_F(RingChannelTest, InitializedRingIsEmpty) {
    auto snap = producer_->snapshot();
    EXPECT_EQ(snap.capacity, kSmallCapacity);
    EXPECT_EQ(snap.entrySize, sizeof(TestEntry));
    EXPECT_EQ(snap.abiVersion, kRingAbiVersion);
    EXPECT_EQ(snap.writeIndex, 0u);
    EXPECT_EQ(snap.readIndex, 0u);
    EXPECT_TRUE(consumer_->isEmpty());
    EXPECT_FALSE(producer_->isFull());
}

TEST_F(RingChannelTest, ScenarioFillDrainAndReuse) {
    // Push A..D into an empty capacity-4 ring
    for (uint64_t i = 0; i < 4; ++i) {
        auto pushed = producer_->push(entry(i));
        ASSERT_TRUE(pushed.has_value());
        EXPECT_EQ(*pushed, i);
    }
    EXPECT_EQ(producer_->occupancy(), 4u);
    EXPECT_TRUE(producer_->isFull());

    // E is refused while full; header and every slot stay byte-identical
    const auto before = regionBytes();
    auto refused = producer_->push(entry(4));
    ASSERT_FALSE(refused.has_value());
    EXPECT_EQ(refused.error(), ProtocolError::ChannelFull);
    EXPECT_FALSE(producer_->tryPush(entry(4)));
    EXPECT_EQ(producer_->snapshot().writeIndex, 4u);
    EXPECT_EQ(producer_->snapshot().readIndex, 0u);
    EXPECT_EQ(regionBytes(), before);

    // Pop returns A and frees one slot
    auto a = consumer_->pop();
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->seq, 0u);
    EXPECT_EQ(consumer_->occupancy(), 3u);

    // E now fits in A's old slot
    EXPECT_TRUE(producer_->tryPush(entry(4)));
    EXPECT_EQ(producer_->snapshot().writeIndex, 5u);

    for (uint64_t expected = 1; expected <= 4; ++expected) {
        auto e = consumer_->pop();
        ASSERT_TRUE(e.has_value());
        EXPECT_EQ(e->seq, expected);
        EXPECT_EQ(e->tag, static_cast<uint32_t>(expected * 7));
    }
    EXPECT_TRUE(consumer_->isEmpty());
}

TEST_F(RingChannelTest, PopOnEmptyLeavesIndicesUnchanged) {
    auto before = consumer_->snapshot();
    auto popped = consumer_->pop();
    ASSERT_FALSE(popped.has_value());
    EXPECT_EQ(popped.error(), ProtocolError::ChannelEmpty);
    EXPECT_FALSE(consumer_->tryPop().has_value());
    auto after = consumer_->snapshot();
    EXPECT_EQ(before.writeIndex, after.writeIndex);
    EXPECT_EQ(before.readIndex, after.readIndex);
}

TEST_F(RingChannelTest, OccupancyNeverExceedsCapacity) {
    for (int round = 0; round < 50; ++round) {
        for (int i = 0; i < 7; ++i) {
            (void)producer_->tryPush(entry(static_cast<uint64_t>(round * 10 + i)));
            EXPECT_LE(producer_->occupancy(), kSmallCapacity);
        }
        for (int i = 0; i < 3; ++i) {
            (void)consumer_->tryPop();
            EXPECT_LE(consumer_->occupancy(), kSmallCapacity);
        }
    }
}

TEST_F(RingChannelTest, FifoAcrossManyCycles) {
    uint64_t nextIn = 0;
    uint64_t nextOut = 0;
    for (int cycle = 0; cycle < 1000; ++cycle) {
        while (producer_->tryPush(entry(nextIn))) ++nextIn;
        const int toPop = 1 + cycle % 4;
        for (int i = 0; i < toPop; ++i) {
            auto e = consumer_->tryPop();
            if (!e) break;
            EXPECT_EQ(e->seq, nextOut);
            ++nextOut;
        }
    }
    while (auto e = consumer_->tryPop()) {
        EXPECT_EQ(e->seq, nextOut);
        ++nextOut;
    }
    EXPECT_EQ(nextIn, nextOut);
}

TEST_F(RingChannelTest, WrapsPast32BitBoundary) {
    const uint64_t start = (uint64_t{1} << 32) - 3;
    setIndices(start, start);

    for (uint64_t i = 0; i < 10; ++i) {
        ASSERT_TRUE(producer_->tryPush(entry(i)));
        ASSERT_TRUE(producer_->tryPush(entry(i + 100)));
        EXPECT_EQ(producer_->occupancy(), 2u);
        auto first = consumer_->pop();
        auto second = consumer_->pop();
        ASSERT_TRUE(first.has_value());
        ASSERT_TRUE(second.has_value());
        EXPECT_EQ(first->seq, i);
        EXPECT_EQ(second->seq, i + 100);
    }
    EXPECT_EQ(consumer_->snapshot().readIndex, start + 20);
    EXPECT_GT(consumer_->snapshot().readIndex, uint64_t{0xFFFFFFFF});
}

TEST_F(RingChannelTest, WrapsPast64BitBoundary) {
    const uint64_t start = std::numeric_limits<uint64_t>::max() - 1;
    setIndices(start, start);

    for (uint64_t i = 0; i < 4; ++i) {
        ASSERT_TRUE(producer_->tryPush(entry(i))) << "push " << i;
    }
    // W has wrapped to 2 while R is still near the top
    EXPECT_EQ(producer_->snapshot().writeIndex, 2u);
    EXPECT_EQ(producer_->occupancy(), 4u);
    EXPECT_FALSE(producer_->tryPush(entry(99)));

    for (uint64_t i = 0; i < 4; ++i) {
        auto e = consumer_->pop();
        ASSERT_TRUE(e.has_value());
        EXPECT_EQ(e->seq, i);
    }
    EXPECT_TRUE(consumer_->isEmpty());
    EXPECT_FALSE(consumer_->poisoned());
}

TEST_F(RingChannelTest, UninitializedHeaderIsNotReady) {
    CapacityProxy(header()).store(0);
    // Counters are irrelevant while capacity is zero
    setIndices(123, 5);

    auto popped = consumer_->pop();
    ASSERT_FALSE(popped.has_value());
    EXPECT_EQ(popped.error(), ProtocolError::ChannelNotReady);
    EXPECT_FALSE(consumer_->poisoned());

    auto pushed = producer_->push(entry(1));
    ASSERT_FALSE(pushed.has_value());
    EXPECT_EQ(pushed.error(), ProtocolError::ChannelNotReady);
    EXPECT_FALSE(producer_->poisoned());

    // Once initialized the channel works normally
    ASSERT_TRUE((InitializeRing<TestEntry, kSmallCapacity>(mapping_->region())).has_value());
    EXPECT_TRUE(producer_->tryPush(entry(1)));
    EXPECT_TRUE(consumer_->tryPop().has_value());
}

TEST_F(RingChannelTest, CorruptedWriteIndexPoisonsConsumer) {
    ASSERT_TRUE(producer_->tryPush(entry(1)));
    // A misbehaving producer claims far more entries than the ring holds
    WriteIndexProxy(header()).store(1000);

    auto popped = consumer_->pop();
    ASSERT_FALSE(popped.has_value());
    EXPECT_EQ(popped.error(), ProtocolError::IndexRangeViolation);
    EXPECT_TRUE(consumer_->poisoned());
    EXPECT_EQ(consumer_->poisonReason(), ProtocolError::IndexRangeViolation);

    // Poisoning is sticky, even if the counters are repaired
    WriteIndexProxy(header()).store(1);
    auto again = consumer_->pop();
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error(), ProtocolError::ChannelPoisoned);
}

TEST_F(RingChannelTest, CorruptedReadIndexPoisonsProducer) {
    // The consumer claims to have read entries that were never written
    ReadIndexProxy(header()).store(10);

    auto pushed = producer_->push(entry(1));
    ASSERT_FALSE(pushed.has_value());
    EXPECT_EQ(pushed.error(), ProtocolError::IndexRangeViolation);
    EXPECT_TRUE(producer_->poisoned());
    EXPECT_EQ(producer_->push(entry(2)).error(), ProtocolError::ChannelPoisoned);
    EXPECT_EQ(producer_->snapshot().writeIndex, 0u);
}

TEST_F(RingChannelTest, LayoutMismatchIsFatal) {
    header().entrySize = 8;
    auto popped = consumer_->pop();
    ASSERT_FALSE(popped.has_value());
    EXPECT_EQ(popped.error(), ProtocolError::LayoutMismatch);
    EXPECT_TRUE(consumer_->poisoned());
}

TEST_F(RingChannelTest, CapacityMismatchIsFatal) {
    CapacityProxy(header()).store(8);
    auto pushed = producer_->push(entry(1));
    ASSERT_FALSE(pushed.has_value());
    EXPECT_EQ(pushed.error(), ProtocolError::LayoutMismatch);
    EXPECT_TRUE(producer_->poisoned());
}

TEST(RingAttachTest, RejectsRegionTooSmall) {
    auto mapping = MappedRegion::create(4096);
    ASSERT_TRUE(mapping.has_value());
    SharedRegion small(( *mapping)->region().base(), SmallLayout::kRegionBytes - 1);

    auto producer = SmallProducer::attach(small);
    ASSERT_FALSE(producer.has_value());
    EXPECT_EQ(producer.error(), ProtocolError::RegionTooSmall);

    auto init = InitializeRing<TestEntry, kSmallCapacity>(small);
    ASSERT_FALSE(init.has_value());
    EXPECT_EQ(init.error(), ProtocolError::RegionTooSmall);
}

TEST(RingAttachTest, RejectsMisalignedRegion) {
    auto mapping = MappedRegion::create(4096);
    ASSERT_TRUE(mapping.has_value());
    SharedRegion shifted((*mapping)->region().base() + 4, 1024);

    auto consumer = SmallConsumer::attach(shifted);
    ASSERT_FALSE(consumer.has_value());
    EXPECT_EQ(consumer.error(), ProtocolError::RegionMisaligned);
}

TEST(SharedRegionTest, TypedViewsAreBoundsChecked) {
    auto mapping = MappedRegion::create(64);
    ASSERT_TRUE(mapping.has_value());
    const SharedRegion region = (*mapping)->region();

    EXPECT_TRUE(region.at<uint64_t>(56).has_value());
    EXPECT_EQ(region.at<uint64_t>(60).error(), ProtocolError::OutOfBounds);
    EXPECT_EQ(region.at<uint64_t>(0, 9).error(), ProtocolError::OutOfBounds);
    EXPECT_EQ(region.at<uint32_t>(2).error(), ProtocolError::RegionMisaligned);
    EXPECT_EQ(region.slice(60, 8).error(), ProtocolError::OutOfBounds);

    auto sub = region.slice(16, 16);
    ASSERT_TRUE(sub.has_value());
    EXPECT_EQ(sub->length(), 16u);
    EXPECT_EQ(SharedRegion().at<uint8_t>(0).error(), ProtocolError::OutOfBounds);
}

TEST(SharedRegionTest, MappedRegionIsZeroFilled) {
    auto mapping = MappedRegion::create(4096);
    ASSERT_TRUE(mapping.has_value());
    auto bytes = (*mapping)->region().at<uint8_t>(0, 4096);
    ASSERT_TRUE(bytes.has_value());
    for (std::size_t i = 0; i < 4096; ++i) {
        ASSERT_EQ((*bytes)[i], 0u) << "byte " << i;
    }
    EXPECT_EQ(MappedRegion::create(0).error(), ProtocolError::RegionTooSmall);
}
