#include "audio/channel_mapper.h"

#include <gtest/gtest.h>
#include <vector>

using namespace segue::audio;

TEST(ChannelMapper, MonoIsDuplicated) {
    const std::vector<float> mono = {0.1f, -0.2f, 0.3f};
    std::vector<float> stereo(6, 0.0f);
    mapToStereo(mono.data(), 1, stereo.data(), 3);
    EXPECT_EQ(stereo, (std::vector<float>{0.1f, 0.1f, -0.2f, -0.2f, 0.3f, 0.3f}));
}

TEST(ChannelMapper, StereoIsCopied) {
    const std::vector<float> input = {0.1f, 0.2f, 0.3f, 0.4f};
    std::vector<float> stereo(4, 0.0f);
    mapToStereo(input.data(), 2, stereo.data(), 2);
    EXPECT_EQ(stereo, input);
}

TEST(ChannelMapper, WideLayoutsAverageEvenAndOddChannels) {
    // 3 channels: L = avg(ch0, ch2), R = ch1.
    const std::vector<float> three = {0.2f, 0.5f, 0.4f};
    std::vector<float> stereo(2, 0.0f);
    mapToStereo(three.data(), 3, stereo.data(), 1);
    EXPECT_FLOAT_EQ(stereo[0], 0.3f);
    EXPECT_FLOAT_EQ(stereo[1], 0.5f);

    // 6 channels: L = avg(0, 2, 4), R = avg(1, 3, 5).
    const std::vector<float> six = {0.3f, 0.6f, 0.3f, 0.0f, 0.3f, 0.3f};
    mapToStereo(six.data(), 6, stereo.data(), 1);
    EXPECT_FLOAT_EQ(stereo[0], 0.3f);
    EXPECT_FLOAT_EQ(stereo[1], 0.3f);
}
