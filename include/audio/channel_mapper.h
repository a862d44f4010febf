#pragma once

#include <cstddef>

namespace segue::audio {

// Folds an interleaved @p channels-wide block into interleaved stereo.
// Mono is duplicated; wider layouts average even channels to the left and odd
// channels to the right. @p stereo must hold frames * 2 samples.
void mapToStereo(const float* interleaved, int channels, float* stereo, size_t frames);

}  // namespace segue::audio
