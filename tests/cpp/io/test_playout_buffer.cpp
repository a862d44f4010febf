#include "io/playout_buffer.h"

#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

using segue::io::PlayoutBuffer;

namespace {

PlayoutBuffer::Config smallConfig() {
    PlayoutBuffer::Config config;
    config.capacityFrames = 16;
    config.headroomFrames = 2;
    config.resumeHysteresisFrames = 4;
    return config;
}

std::vector<float> frames(size_t count, float base = 0.0f) {
    std::vector<float> data(count * 2);
    for (size_t i = 0; i < count; ++i) {
        data[i * 2] = base + static_cast<float>(i);
        data[i * 2 + 1] = -(base + static_cast<float>(i));
    }
    return data;
}

}  // namespace

TEST(PlayoutBuffer, RejectsInvalidGeometry) {
    PlayoutBuffer::Config config = smallConfig();
    config.capacityFrames = 0;
    EXPECT_THROW(PlayoutBuffer{config}, std::invalid_argument);

    config = smallConfig();
    config.headroomFrames = 0;
    EXPECT_THROW(PlayoutBuffer{config}, std::invalid_argument);

    config = smallConfig();
    config.headroomFrames = 16;
    EXPECT_THROW(PlayoutBuffer{config}, std::invalid_argument);
}

TEST(PlayoutBuffer, HysteresisIsClampedToUsableSpace) {
    PlayoutBuffer::Config config = smallConfig();
    config.resumeHysteresisFrames = 100;
    PlayoutBuffer buffer(config);
    EXPECT_EQ(buffer.resumeHysteresisFrames(), 14u);
}

TEST(PlayoutBuffer, ReadsBackInOrderAcrossWrap) {
    PlayoutBuffer buffer(smallConfig());
    auto first = frames(10);
    ASSERT_EQ(buffer.writeFrames(first.data(), 10), 10u);

    std::vector<float> out(10 * 2);
    ASSERT_EQ(buffer.readFrames(out.data(), 8), 8u);

    auto second = frames(12, 10.0f);
    ASSERT_EQ(buffer.writeFrames(second.data(), 12), 12u);
    EXPECT_EQ(buffer.availableFrames(), 14u);

    std::vector<float> rest(14 * 2);
    ASSERT_EQ(buffer.readFrames(rest.data(), 14), 14u);
    for (size_t i = 0; i < 14; ++i) {
        EXPECT_FLOAT_EQ(rest[i * 2], static_cast<float>(8 + i)) << "frame " << i;
        EXPECT_FLOAT_EQ(rest[i * 2 + 1], -static_cast<float>(8 + i)) << "frame " << i;
    }
    EXPECT_EQ(buffer.totalWritten(), 22u);
    EXPECT_EQ(buffer.totalRead(), 22u);
}

TEST(PlayoutBuffer, WriteIsLimitedByFreeSpace) {
    PlayoutBuffer buffer(smallConfig());
    auto data = frames(20);
    EXPECT_EQ(buffer.writeFrames(data.data(), 20), 16u);
    EXPECT_EQ(buffer.freeFrames(), 0u);
}

TEST(PlayoutBuffer, PauseFlagRaisedAtHeadroom) {
    PlayoutBuffer buffer(smallConfig());
    auto data = frames(13);
    buffer.writeFrames(data.data(), 13);
    EXPECT_FALSE(buffer.shouldPauseProducer());

    buffer.writeFrames(data.data(), 1);
    EXPECT_EQ(buffer.freeFrames(), 2u);
    EXPECT_TRUE(buffer.shouldPauseProducer());
}

TEST(PlayoutBuffer, ResumeCallbackFiresOnceAfterHysteresis) {
    PlayoutBuffer buffer(smallConfig());
    int resumes = 0;
    buffer.setResumeCallback([&resumes]() { ++resumes; });

    auto data = frames(16);
    buffer.writeFrames(data.data(), 16);
    ASSERT_TRUE(buffer.shouldPauseProducer());

    // free = 3, 5: still below headroom + hysteresis (6).
    std::vector<float> out(16 * 2);
    buffer.readFrames(out.data(), 3);
    buffer.skipFrames(2);
    EXPECT_TRUE(buffer.shouldPauseProducer());
    EXPECT_EQ(resumes, 0);

    buffer.skipFrames(1);
    EXPECT_FALSE(buffer.shouldPauseProducer());
    EXPECT_EQ(resumes, 1);

    buffer.readFrames(out.data(), 5);
    EXPECT_EQ(resumes, 1);
}

TEST(PlayoutBuffer, ExhaustedOnlyAfterDecodeCompleteAndDrained) {
    PlayoutBuffer buffer(smallConfig());
    EXPECT_FALSE(buffer.isExhausted());

    auto data = frames(4);
    buffer.writeFrames(data.data(), 4);
    buffer.markDecodeComplete();
    EXPECT_TRUE(buffer.isDecodeComplete());
    EXPECT_FALSE(buffer.isExhausted());

    EXPECT_EQ(buffer.skipFrames(10), 4u);
    EXPECT_TRUE(buffer.isExhausted());
}

TEST(PlayoutBuffer, ResetRestoresEmptyState) {
    PlayoutBuffer buffer(smallConfig());
    int resumes = 0;
    buffer.setResumeCallback([&resumes]() { ++resumes; });
    auto data = frames(16);
    buffer.writeFrames(data.data(), 16);
    buffer.markDecodeComplete();

    buffer.reset();
    EXPECT_EQ(buffer.availableFrames(), 0u);
    EXPECT_FALSE(buffer.shouldPauseProducer());
    EXPECT_FALSE(buffer.isDecodeComplete());
    EXPECT_EQ(buffer.totalWritten(), 0u);

    // Callback survives reset.
    buffer.writeFrames(data.data(), 16);
    buffer.skipFrames(16);
    EXPECT_EQ(resumes, 1);
}
