#include "audio/resample_quality.h"

#include <algorithm>
#include <cctype>
#include <string>

namespace segue::audio {

std::optional<ResampleQuality> parseResampleQuality(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::replace(lower.begin(), lower.end(), '-', '_');
    if (lower == "sinc_best" || lower == "best") {
        return ResampleQuality::SincBest;
    }
    if (lower == "sinc_medium" || lower == "medium") {
        return ResampleQuality::SincMedium;
    }
    if (lower == "sinc_fastest" || lower == "fastest") {
        return ResampleQuality::SincFastest;
    }
    if (lower == "zero_order_hold" || lower == "zoh") {
        return ResampleQuality::ZeroOrderHold;
    }
    if (lower == "linear") {
        return ResampleQuality::Linear;
    }
    return std::nullopt;
}

const char* resampleQualityToString(ResampleQuality quality) {
    switch (quality) {
    case ResampleQuality::SincBest:
        return "sinc_best";
    case ResampleQuality::SincMedium:
        return "sinc_medium";
    case ResampleQuality::SincFastest:
        return "sinc_fastest";
    case ResampleQuality::ZeroOrderHold:
        return "zero_order_hold";
    case ResampleQuality::Linear:
        return "linear";
    }
    return "unknown";
}

}  // namespace segue::audio
