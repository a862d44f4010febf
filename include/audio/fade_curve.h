#pragma once

#include <optional>
#include <string_view>

namespace segue::audio {

// Volume envelope shapes for passage fades and the mixer resume ramp.
enum class FadeCurve {
    Linear,
    Exponential,  // t^2 in, (1-t)^2 out
    Logarithmic,  // sqrt(t) in, (1-t)^2 out
    SCurve,       // raised cosine, a.k.a. "cosine"
    EqualPower    // sin/cos quarter wave
};

/// Gain in [0, 1] at normalized progress @p t (clamped to [0, 1]).
float fadeInGain(FadeCurve curve, double t);
float fadeOutGain(FadeCurve curve, double t);

/// Case-insensitive; accepts the aliases "cosine", "s-curve", "equal_power", ...
std::optional<FadeCurve> parseFadeCurve(std::string_view name);

const char* fadeCurveToString(FadeCurve curve);

}  // namespace segue::audio
