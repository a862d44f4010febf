#include "playback/buffer_manager.h"

#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <vector>

using namespace segue::playback;
using segue::io::PlayoutBuffer;

namespace {

class BufferManagerTest : public ::testing::Test {
   protected:
    EventBus bus;
    std::vector<BufferEvent> events;
    std::vector<std::unique_ptr<PlayoutBuffer>> rings;

    void SetUp() override {
        bus.subscribe(
            EventBus::BufferHandler([this](const BufferEvent& e) { events.push_back(e); }));
    }

    // 1 frame per ms.
    BufferManager::Config config(int minMs = 300, int firstMs = 100) {
        BufferManager::Config c;
        c.outputRate = 1000;
        c.minBufferThresholdMs = minMs;
        c.firstPassageThresholdMs = firstMs;
        return c;
    }

    PlayoutBuffer* newRing() {
        PlayoutBuffer::Config c;
        c.capacityFrames = 1000;
        c.headroomFrames = 10;
        c.resumeHysteresisFrames = 100;
        rings.push_back(std::make_unique<PlayoutBuffer>(c));
        return rings.back().get();
    }

    static void fill(PlayoutBuffer* ring, size_t frames) {
        std::vector<float> block(frames * 2, 0.1f);
        ring->writeFrames(block.data(), frames);
    }

    std::vector<BufferEventKind> drainKinds() {
        events.clear();
        bus.drain();
        std::vector<BufferEventKind> kinds;
        for (const auto& e : events) {
            kinds.push_back(e.kind);
        }
        return kinds;
    }
};

}  // namespace

TEST_F(BufferManagerTest, FirstPassageUsesShorterThreshold) {
    BufferManager buffers(bus, config());
    PlayoutBuffer* ring = newRing();
    buffers.registerBuffer("a", ring);
    EXPECT_EQ(buffers.thresholdFrames(*ring), 100u);

    buffers.markPlaying("a");
    EXPECT_EQ(buffers.thresholdFrames(*ring), 300u);
}

TEST_F(BufferManagerTest, ThresholdCappedByUsableCapacity) {
    BufferManager buffers(bus, config(5000, 5000));
    PlayoutBuffer* ring = newRing();
    EXPECT_EQ(buffers.thresholdFrames(*ring), 990u);

    BufferManager zero(bus, config(0, 0));
    EXPECT_EQ(zero.thresholdFrames(*ring), 1u);
}

TEST_F(BufferManagerTest, ReadyForStartFiresOnceOnRisingEdge) {
    BufferManager buffers(bus, config());
    PlayoutBuffer* ring = newRing();
    buffers.registerBuffer("a", ring);
    EXPECT_EQ(buffers.state("a"), BufferState::Empty);

    fill(ring, 50);
    buffers.notifySamplesAppended("a");
    EXPECT_TRUE(drainKinds().empty());
    EXPECT_EQ(buffers.state("a"), BufferState::Filling);
    EXPECT_FALSE(buffers.hasMinimumPlaybackBuffer("a"));

    fill(ring, 60);
    buffers.notifySamplesAppended("a");
    auto kinds = drainKinds();
    ASSERT_EQ(kinds.size(), 1u);
    EXPECT_EQ(kinds[0], BufferEventKind::ReadyForStart);
    EXPECT_EQ(events[0].entryId, "a");
    EXPECT_EQ(events[0].occupancyFrames, 110u);
    EXPECT_EQ(buffers.state("a"), BufferState::Ready);
    EXPECT_TRUE(buffers.hasMinimumPlaybackBuffer("a"));

    fill(ring, 100);
    buffers.notifySamplesAppended("a");
    EXPECT_TRUE(drainKinds().empty());
}

TEST_F(BufferManagerTest, ShortPassageBecomesReadyOnDecodeComplete) {
    BufferManager buffers(bus, config());
    PlayoutBuffer* ring = newRing();
    buffers.registerBuffer("a", ring);
    fill(ring, 20);
    buffers.notifySamplesAppended("a");
    buffers.notifyDecodeComplete("a");

    EXPECT_EQ(drainKinds(), (std::vector<BufferEventKind>{BufferEventKind::ReadyForStart,
                                                          BufferEventKind::DecodeFinished}));
    EXPECT_EQ(buffers.state("a"), BufferState::Ready);
    EXPECT_TRUE(buffers.hasMinimumPlaybackBuffer("a"));

    buffers.markPlaying("a");
    EXPECT_EQ(buffers.state("a"), BufferState::Finished);
}

TEST_F(BufferManagerTest, DecodeCompleteAfterReadyOnlyReportsFinish) {
    BufferManager buffers(bus, config());
    PlayoutBuffer* ring = newRing();
    buffers.registerBuffer("a", ring);
    fill(ring, 200);
    buffers.notifySamplesAppended("a");
    buffers.markPlaying("a");
    drainKinds();

    buffers.notifyDecodeComplete("a");
    EXPECT_EQ(drainKinds(), std::vector<BufferEventKind>{BufferEventKind::DecodeFinished});
    EXPECT_EQ(buffers.state("a"), BufferState::Finished);
}

TEST_F(BufferManagerTest, BufferLowOnlyWhilePlaying) {
    BufferManager buffers(bus, config());
    PlayoutBuffer* ring = newRing();
    buffers.registerBuffer("a", ring);
    fill(ring, 500);
    buffers.notifySamplesAppended("a");
    drainKinds();

    ring->skipFrames(450);
    buffers.checkFallingThreshold("a");
    EXPECT_TRUE(drainKinds().empty());

    buffers.markPlaying("a");
    buffers.checkFallingThreshold("a");
    EXPECT_EQ(drainKinds(), std::vector<BufferEventKind>{BufferEventKind::BufferLow});

    buffers.checkFallingThreshold("a");
    EXPECT_TRUE(drainKinds().empty());

    // Refilling above the threshold re-arms the low warning.
    fill(ring, 400);
    buffers.notifySamplesAppended("a");
    ring->skipFrames(400);
    buffers.checkFallingThreshold("a");
    EXPECT_EQ(drainKinds(), std::vector<BufferEventKind>{BufferEventKind::BufferLow});
}

TEST_F(BufferManagerTest, NoBufferLowAfterDecodeComplete) {
    BufferManager buffers(bus, config());
    PlayoutBuffer* ring = newRing();
    buffers.registerBuffer("a", ring);
    fill(ring, 500);
    buffers.notifySamplesAppended("a");
    buffers.markPlaying("a");
    buffers.notifyDecodeComplete("a");
    drainKinds();

    ring->skipFrames(490);
    buffers.checkFallingThreshold("a");
    EXPECT_TRUE(drainKinds().empty());
    EXPECT_TRUE(buffers.hasMinimumPlaybackBuffer("a"));

    ring->skipFrames(10);
    EXPECT_FALSE(buffers.hasMinimumPlaybackBuffer("a"));
}

TEST_F(BufferManagerTest, SnapshotAndOccupancy) {
    BufferManager buffers(bus, config());
    PlayoutBuffer* b = newRing();
    PlayoutBuffer* a = newRing();
    buffers.registerBuffer("b", b);
    buffers.registerBuffer("a", a);
    fill(a, 250);

    EXPECT_EQ(buffers.occupancyFrames("a"), 250u);
    EXPECT_EQ(buffers.occupancyTicks("a"), segue::timing::msToTicks(250));

    const auto snap = buffers.snapshot();
    ASSERT_EQ(snap.size(), 2u);
    EXPECT_EQ(snap[0].entryId, "a");
    EXPECT_EQ(snap[0].occupancyMs, 250);
    EXPECT_EQ(snap[0].capacityFrames, 1000u);
    EXPECT_EQ(snap[1].entryId, "b");
}

TEST_F(BufferManagerTest, UnknownEntriesAreIgnored) {
    BufferManager buffers(bus, config());
    buffers.notifySamplesAppended("ghost");
    buffers.notifyDecodeComplete("ghost");
    buffers.checkFallingThreshold("ghost");
    buffers.markPlaying("ghost");
    EXPECT_TRUE(drainKinds().empty());
    EXPECT_FALSE(buffers.state("ghost").has_value());
    EXPECT_EQ(buffers.occupancyFrames("ghost"), 0u);
    EXPECT_FALSE(buffers.remove("ghost"));
}

TEST_F(BufferManagerTest, RemoveStopsTracking) {
    BufferManager buffers(bus, config());
    buffers.registerBuffer("a", newRing());
    EXPECT_TRUE(buffers.isManaged("a"));
    EXPECT_TRUE(buffers.remove("a"));
    EXPECT_FALSE(buffers.isManaged("a"));
}

TEST_F(BufferManagerTest, RejectsInvalidInput) {
    EXPECT_THROW(BufferManager(bus, config()).registerBuffer("a", nullptr),
                 std::invalid_argument);
    BufferManager::Config bad = config();
    bad.outputRate = 0;
    EXPECT_THROW(BufferManager(bus, bad), std::invalid_argument);
}
