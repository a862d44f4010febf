#include "playback/passage_timing.h"
#include "test_support.h"

#include <gtest/gtest.h>

using namespace segue::playback;
using segue::audio::FadeCurve;
using segue::test::makeEntry;
using segue::timing::msToTicks;

namespace {

PassageTiming linearTiming() {
    PassageTiming timing;
    timing.start = 0;
    timing.end = msToTicks(10000);
    timing.fadeInPoint = msToTicks(1000);
    timing.leadInPoint = msToTicks(2000);
    timing.fadeOutPoint = msToTicks(9000);
    timing.leadOutPoint = msToTicks(8000);
    timing.fadeInCurve = FadeCurve::Linear;
    timing.fadeOutCurve = FadeCurve::Linear;
    return timing;
}

}  // namespace

TEST(PassageTiming, AcceptsConsistentTiming) {
    EXPECT_FALSE(validateTiming(linearTiming()).has_value());
    EXPECT_FALSE(validateTiming(PassageTiming{}).has_value());
}

TEST(PassageTiming, RejectsInconsistentTiming) {
    PassageTiming timing = linearTiming();
    timing.start = -1;
    EXPECT_TRUE(validateTiming(timing).has_value());

    timing = linearTiming();
    timing.end = timing.start;
    EXPECT_TRUE(validateTiming(timing).has_value());

    timing = linearTiming();
    timing.fadeInPoint = msToTicks(11000);
    EXPECT_TRUE(validateTiming(timing).has_value());

    timing = linearTiming();
    timing.leadOutPoint = msToTicks(12000);
    EXPECT_TRUE(validateTiming(timing).has_value());

    timing = linearTiming();
    timing.fadeInPoint = msToTicks(9500);
    EXPECT_TRUE(validateTiming(timing).has_value());
}

TEST(PassageTiming, OpenEndedPointsOnlyNeedToFollowStart) {
    PassageTiming timing;
    timing.start = msToTicks(500);
    timing.fadeInPoint = msToTicks(60000);
    timing.leadInPoint = msToTicks(500);
    EXPECT_FALSE(validateTiming(timing).has_value());

    timing.fadeInPoint = msToTicks(100);
    EXPECT_TRUE(validateTiming(timing).has_value());
}

TEST(PassageTiming, EffectiveEndPrefersDeclaredEnd) {
    QueueEntry entry = makeEntry("a", "a.wav");
    EXPECT_FALSE(effectiveEnd(entry).has_value());

    entry.discoveredEnd = msToTicks(4000);
    EXPECT_EQ(effectiveEnd(entry), msToTicks(4000));

    entry.timing.end = msToTicks(3000);
    EXPECT_EQ(effectiveEnd(entry), msToTicks(3000));
}

TEST(PassageTiming, EnvelopeFollowsFadeRegions) {
    const PassageTiming timing = linearTiming();
    EXPECT_FLOAT_EQ(envelopeGain(timing, timing.end, 0), 0.0f);
    EXPECT_NEAR(envelopeGain(timing, timing.end, msToTicks(500)), 0.5f, 1e-6f);
    EXPECT_FLOAT_EQ(envelopeGain(timing, timing.end, msToTicks(1000)), 1.0f);
    EXPECT_FLOAT_EQ(envelopeGain(timing, timing.end, msToTicks(5000)), 1.0f);
    EXPECT_NEAR(envelopeGain(timing, timing.end, msToTicks(9500)), 0.5f, 1e-6f);
    EXPECT_NEAR(envelopeGain(timing, timing.end, msToTicks(10000)), 0.0f, 1e-6f);
}

TEST(PassageTiming, FadeOutNeedsAKnownEnd) {
    PassageTiming timing = linearTiming();
    timing.end.reset();
    EXPECT_FLOAT_EQ(envelopeGain(timing, std::nullopt, msToTicks(9500)), 1.0f);
    EXPECT_NEAR(envelopeGain(timing, msToTicks(10000), msToTicks(9500)), 0.5f, 1e-6f);
}

TEST(PassageTiming, CrossfadeOverlapTakesTheShorterSide) {
    QueueEntry current = makeEntry("a", "a.wav", 0, 10000);
    current.timing.leadOutPoint = msToTicks(8000);
    QueueEntry next = makeEntry("b", "b.wav");
    next.timing.leadInPoint = msToTicks(3000);

    EXPECT_EQ(crossfadeOverlap(current, next), msToTicks(2000));
    EXPECT_EQ(crossfadeStartTick(current, next), msToTicks(8000));

    next.timing.leadInPoint = msToTicks(500);
    EXPECT_EQ(crossfadeOverlap(current, next), msToTicks(500));
    EXPECT_EQ(crossfadeStartTick(current, next), msToTicks(9500));
}

TEST(PassageTiming, CrossfadeStartIsRelativeToPassageStart) {
    QueueEntry current = makeEntry("a", "a.wav", 1000, 10000);
    current.timing.leadOutPoint = msToTicks(8000);
    QueueEntry next = makeEntry("b", "b.wav");
    next.timing.leadInPoint = msToTicks(5000);
    EXPECT_EQ(crossfadeStartTick(current, next), msToTicks(7000));
}

TEST(PassageTiming, NoOverlapWithoutRoomOrKnownEnd) {
    QueueEntry current = makeEntry("a", "a.wav", 0, 10000);
    QueueEntry next = makeEntry("b", "b.wav");
    next.timing.leadInPoint = msToTicks(3000);
    // Lead-out defaults to the end.
    EXPECT_EQ(crossfadeOverlap(current, next), 0);
    EXPECT_FALSE(crossfadeStartTick(current, next).has_value());

    QueueEntry openEnded = makeEntry("c", "c.wav");
    openEnded.timing.leadOutPoint = msToTicks(8000);
    EXPECT_EQ(crossfadeOverlap(openEnded, next), 0);

    openEnded.discoveredEnd = msToTicks(9000);
    EXPECT_EQ(crossfadeOverlap(openEnded, next), msToTicks(1000));
}
