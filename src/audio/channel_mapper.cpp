#include "audio/channel_mapper.h"

#include <cstring>

namespace segue::audio {

void mapToStereo(const float* interleaved, int channels, float* stereo, size_t frames) {
    if (channels == 2) {
        std::memcpy(stereo, interleaved, frames * 2 * sizeof(float));
        return;
    }
    if (channels == 1) {
        for (size_t i = 0; i < frames; ++i) {
            stereo[i * 2] = interleaved[i];
            stereo[i * 2 + 1] = interleaved[i];
        }
        return;
    }

    const size_t width = static_cast<size_t>(channels);
    const float leftCount = static_cast<float>((width + 1) / 2);
    const float rightCount = static_cast<float>(width / 2);
    for (size_t i = 0; i < frames; ++i) {
        const float* frame = interleaved + i * width;
        float left = 0.0f;
        float right = 0.0f;
        for (size_t ch = 0; ch < width; ++ch) {
            if (ch % 2 == 0) {
                left += frame[ch];
            } else {
                right += frame[ch];
            }
        }
        stereo[i * 2] = left / leftCount;
        stereo[i * 2 + 1] = right / rightCount;
    }
}

}  // namespace segue::audio
