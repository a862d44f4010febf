#include "playback/queue_manager.h"
#include "test_support.h"

#include <gtest/gtest.h>
#include <initializer_list>
#include <string>
#include <vector>

using namespace segue::playback;
using segue::test::makeEntry;
using segue::timing::msToTicks;

namespace {

// QueueManager owns a mutex and cannot be returned by value.
void fill(QueueManager& queue, std::initializer_list<const char*> ids) {
    for (const char* id : ids) {
        queue.enqueue(makeEntry(id, std::string(id) + ".wav"));
    }
}

std::vector<std::string> idsOf(const std::vector<QueueEntry>& entries) {
    std::vector<std::string> ids;
    for (const auto& e : entries) {
        ids.push_back(e.queueEntryId);
    }
    return ids;
}

}  // namespace

TEST(QueueManager, EnqueueFillsTiersInOrder) {
    QueueManager queue;
    EXPECT_TRUE(queue.empty());
    EXPECT_EQ(queue.enqueue(makeEntry("a", "a.wav")), QueuePosition::Current);
    EXPECT_EQ(queue.enqueue(makeEntry("b", "b.wav")), QueuePosition::Next);
    EXPECT_EQ(queue.enqueue(makeEntry("c", "c.wav")), QueuePosition::Queued);
    EXPECT_EQ(queue.enqueue(makeEntry("d", "d.wav")), QueuePosition::Queued);

    EXPECT_EQ(queue.current()->queueEntryId, "a");
    EXPECT_EQ(queue.next()->queueEntryId, "b");
    EXPECT_EQ(idsOf(queue.queued()), (std::vector<std::string>{"c", "d"}));
    EXPECT_EQ(queue.size(), 4u);

    const PositionInfo pos = queue.positionOf("d");
    EXPECT_EQ(pos.kind, QueuePosition::Queued);
    EXPECT_EQ(pos.queuedIndex, 1u);
    EXPECT_EQ(queue.positionOf("zzz").kind, QueuePosition::None);
}

TEST(QueueManager, EnqueueAssignsIncreasingPlayOrder) {
    QueueManager queue;
    QueueEntry first = makeEntry("a", "a.wav");
    first.playOrder = 10;
    queue.enqueue(first);
    queue.enqueue(makeEntry("b", "b.wav"));

    const auto entries = queue.snapshot();
    EXPECT_EQ(entries[0].playOrder, 10);
    EXPECT_EQ(entries[1].playOrder, 11);
    EXPECT_EQ(queue.nextPlayOrder(), 12);
}

TEST(QueueManager, RemovingCurrentPromotesNextAndQueued) {
    QueueManager queue;
    fill(queue, {"a", "b", "c"});
    std::vector<std::string> promoted;
    ASSERT_TRUE(queue.remove("a", &promoted));
    EXPECT_EQ(promoted, (std::vector<std::string>{"b", "c"}));
    EXPECT_EQ(queue.current()->queueEntryId, "b");
    EXPECT_EQ(queue.next()->queueEntryId, "c");
}

TEST(QueueManager, RemovingNextPromotesOnlyTheFirstQueued) {
    QueueManager queue;
    fill(queue, {"a", "b", "c", "d"});
    std::vector<std::string> promoted;
    ASSERT_TRUE(queue.remove("b", &promoted));
    EXPECT_EQ(promoted, std::vector<std::string>{"c"});
}

TEST(QueueManager, RemovingQueuedPromotesNothing) {
    QueueManager queue;
    fill(queue, {"a", "b", "c", "d"});
    std::vector<std::string> promoted{"stale"};
    ASSERT_TRUE(queue.remove("c", &promoted));
    EXPECT_TRUE(promoted.empty());
    EXPECT_FALSE(queue.remove("c"));
}

TEST(QueueManager, AdvanceDropsCurrent) {
    QueueManager queue;
    fill(queue, {"a", "b", "c"});
    EXPECT_EQ(queue.advance(), (std::vector<std::string>{"b", "c"}));
    EXPECT_EQ(queue.advance(), std::vector<std::string>{"c"});
    EXPECT_TRUE(queue.advance().empty());
    EXPECT_TRUE(queue.empty());
    EXPECT_TRUE(queue.advance().empty());
}

TEST(QueueManager, DiscoveredEndpointIsStored) {
    QueueManager queue;
    fill(queue, {"a"});
    EXPECT_TRUE(queue.setDiscoveredEndpoint("a", msToTicks(1234)));
    EXPECT_EQ(queue.find("a")->discoveredEnd, msToTicks(1234));
    EXPECT_FALSE(queue.setDiscoveredEndpoint("b", 1));
    EXPECT_FALSE(queue.find("b").has_value());
}

TEST(QueueManager, RestoreSortsAndDropsInvalidRows) {
    QueueEntry late = makeEntry("late", "l.wav");
    late.playOrder = 30;
    QueueEntry early = makeEntry("early", "e.wav");
    early.playOrder = 5;
    QueueEntry broken = makeEntry("broken", "b.wav", 1000, 500);
    broken.playOrder = 10;

    QueueManager queue;
    fill(queue, {"old"});
    EXPECT_EQ(queue.restore({late, broken, early}), 2u);
    EXPECT_EQ(idsOf(queue.snapshot()), (std::vector<std::string>{"early", "late"}));
    EXPECT_EQ(queue.nextPlayOrder(), 31);
}

TEST(QueueManager, ClearEmptiesQueue) {
    QueueManager queue;
    fill(queue, {"a", "b"});
    queue.clear();
    EXPECT_TRUE(queue.empty());
    EXPECT_FALSE(queue.current().has_value());
    EXPECT_FALSE(queue.next().has_value());
}
