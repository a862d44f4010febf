#include "core/tick_clock.h"

#include <gtest/gtest.h>
#include <stdexcept>

using namespace segue::timing;

TEST(TickClock, EverySupportedRateHasWholeTicksPerSample) {
    for (int rate : SUPPORTED_SAMPLE_RATES) {
        EXPECT_EQ(TICK_RATE % rate, 0) << "rate " << rate;
        EXPECT_EQ(ticksPerSample(rate) * rate, TICK_RATE) << "rate " << rate;
    }
}

TEST(TickClock, KnownTicksPerSample) {
    EXPECT_EQ(ticksPerSample(44100), 640);
    EXPECT_EQ(ticksPerSample(48000), 588);
    EXPECT_EQ(ticksPerSample(192000), 147);
}

TEST(TickClock, SampleConversionIsExactForSupportedRates) {
    for (int rate : SUPPORTED_SAMPLE_RATES) {
        const std::int64_t samples = static_cast<std::int64_t>(rate) * 3 + 17;
        EXPECT_EQ(ticksToSamples(samplesToTicks(samples, rate), rate), samples) << "rate " << rate;
    }
}

TEST(TickClock, TicksToSamplesFloorsPartialSamples) {
    EXPECT_EQ(ticksToSamples(639, 44100), 0);
    EXPECT_EQ(ticksToSamples(640, 44100), 1);
    EXPECT_EQ(ticksToSamples(1279, 44100), 1);
}

TEST(TickClock, LongPassagesDoNotOverflow) {
    // Twelve hours at 192 kHz.
    const std::int64_t samples = 192000LL * 3600 * 12;
    const Ticks ticks = samplesToTicks(samples, 192000);
    EXPECT_EQ(ticks, TICK_RATE * 3600 * 12);
    EXPECT_EQ(ticksToSamples(ticks, 192000), samples);
}

TEST(TickClock, MillisecondsAndSeconds) {
    EXPECT_EQ(msToTicks(1000), TICK_RATE);
    EXPECT_EQ(msToTicks(1), 28224);
    EXPECT_EQ(ticksToMs(TICK_RATE * 2 + 28223), 2000);
    EXPECT_EQ(secondsToTicks(1.5), TICK_RATE + TICK_RATE / 2);
    EXPECT_DOUBLE_EQ(ticksToSeconds(TICK_RATE / 4), 0.25);
}

TEST(TickClock, SupportedRateLookup) {
    EXPECT_TRUE(isSupportedRate(44100));
    EXPECT_TRUE(isSupportedRate(8000));
    EXPECT_FALSE(isSupportedRate(44000));
    EXPECT_FALSE(isSupportedRate(0));
}

TEST(TickClock, NonPositiveRateThrows) {
    EXPECT_THROW(ticksPerSample(0), std::invalid_argument);
    EXPECT_THROW(samplesToTicks(10, -1), std::invalid_argument);
    EXPECT_THROW(ticksToSamples(10, 0), std::invalid_argument);
}
