#pragma once

#include <optional>
#include <string_view>

namespace segue::audio {

// libsamplerate converter types, best quality first.
enum class ResampleQuality { SincBest, SincMedium, SincFastest, ZeroOrderHold, Linear };

/// Case-insensitive; accepts "best", "medium", "fastest", "zoh" as short forms.
std::optional<ResampleQuality> parseResampleQuality(std::string_view name);

const char* resampleQualityToString(ResampleQuality quality);

}  // namespace segue::audio
