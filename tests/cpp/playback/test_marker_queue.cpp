#include "playback/marker_queue.h"

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace segue::playback;

TEST(MarkerQueue, PopsInPushOrder) {
    MarkerQueue queue(4);
    EXPECT_TRUE(queue.empty());
    EXPECT_EQ(queue.capacity(), 4u);
    ASSERT_TRUE(queue.push("a", MarkerKind::StartCrossfade, 100, 1));
    ASSERT_TRUE(queue.push("b", MarkerKind::PassageComplete, 200, 2));

    MarkerEvent event;
    ASSERT_TRUE(queue.pop(event));
    EXPECT_EQ(event.entryId, "a");
    EXPECT_EQ(event.kind, MarkerKind::StartCrossfade);
    EXPECT_EQ(event.tick, 100);
    EXPECT_EQ(event.positionMs, 1);
    ASSERT_TRUE(queue.pop(event));
    EXPECT_EQ(event.entryId, "b");
    EXPECT_FALSE(queue.pop(event));
    EXPECT_TRUE(queue.empty());
}

TEST(MarkerQueue, FullQueueDropsNewestAndCounts) {
    MarkerQueue queue(2);
    EXPECT_TRUE(queue.push("a", MarkerKind::PositionUpdate, 1, 0));
    EXPECT_TRUE(queue.push("b", MarkerKind::PositionUpdate, 2, 0));
    EXPECT_FALSE(queue.push("c", MarkerKind::PositionUpdate, 3, 0));
    EXPECT_EQ(queue.dropped(), 1u);

    std::vector<std::string> ids;
    EXPECT_EQ(queue.drain([&ids](const MarkerEvent& e) { ids.push_back(e.entryId); }), 2u);
    EXPECT_EQ(ids, (std::vector<std::string>{"a", "b"}));

    // Space is reusable after draining.
    EXPECT_TRUE(queue.push("d", MarkerKind::EndOfFile, 4, 0));
    EXPECT_EQ(queue.dropped(), 1u);
}

TEST(MarkerQueue, LongIdsSurviveTheCopy) {
    MarkerQueue queue(1, 4);
    const std::string id(200, 'x');
    ASSERT_TRUE(queue.push(id, MarkerKind::EndOfFile, 0, 0));
    MarkerEvent event;
    ASSERT_TRUE(queue.pop(event));
    EXPECT_EQ(event.entryId, id);
}

TEST(MarkerQueue, ZeroCapacityIsRejected) {
    EXPECT_THROW(MarkerQueue(0), std::invalid_argument);
}

TEST(MarkerQueue, ProducerAndConsumerThreadsAgreeOnOrder) {
    MarkerQueue queue(8);
    constexpr int kCount = 5000;
    std::thread producer([&queue] {
        for (int i = 0; i < kCount;) {
            if (queue.push("p", MarkerKind::PositionUpdate, i, i)) {
                ++i;
            } else {
                std::this_thread::yield();
            }
        }
    });
    std::vector<segue::playback::Ticks> ticks;
    MarkerEvent event;
    while (ticks.size() < static_cast<size_t>(kCount)) {
        if (queue.pop(event)) {
            ticks.push_back(event.tick);
        } else {
            std::this_thread::yield();
        }
    }
    producer.join();
    for (int i = 0; i < kCount; ++i) {
        ASSERT_EQ(ticks[static_cast<size_t>(i)], i);
    }
}
