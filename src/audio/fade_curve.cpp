#include "audio/fade_curve.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>

namespace segue::audio {

namespace {

constexpr double kPi = 3.14159265358979323846;

std::string toLower(std::string_view str) {
    std::string lower(str);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

float clampGain(double gain) {
    return static_cast<float>(std::clamp(gain, 0.0, 1.0));
}

}  // namespace

float fadeInGain(FadeCurve curve, double t) {
    t = std::clamp(t, 0.0, 1.0);
    switch (curve) {
    case FadeCurve::Linear:
        return clampGain(t);
    case FadeCurve::Exponential:
        return clampGain(t * t);
    case FadeCurve::Logarithmic:
        return clampGain(std::sqrt(t));
    case FadeCurve::SCurve:
        return clampGain(0.5 * (1.0 - std::cos(kPi * t)));
    case FadeCurve::EqualPower:
        return clampGain(std::sin(t * kPi / 2.0));
    }
    return clampGain(t);
}

float fadeOutGain(FadeCurve curve, double t) {
    t = std::clamp(t, 0.0, 1.0);
    const double inv = 1.0 - t;
    switch (curve) {
    case FadeCurve::Linear:
        return clampGain(inv);
    case FadeCurve::Exponential:
    case FadeCurve::Logarithmic:
        return clampGain(inv * inv);
    case FadeCurve::SCurve:
        return clampGain(0.5 * (1.0 + std::cos(kPi * t)));
    case FadeCurve::EqualPower:
        return clampGain(std::cos(t * kPi / 2.0));
    }
    return clampGain(inv);
}

std::optional<FadeCurve> parseFadeCurve(std::string_view name) {
    const std::string lower = toLower(name);
    if (lower == "linear") {
        return FadeCurve::Linear;
    }
    if (lower == "exponential") {
        return FadeCurve::Exponential;
    }
    if (lower == "logarithmic") {
        return FadeCurve::Logarithmic;
    }
    if (lower == "cosine" || lower == "scurve" || lower == "s-curve" || lower == "s_curve") {
        return FadeCurve::SCurve;
    }
    if (lower == "equal_power" || lower == "equalpower") {
        return FadeCurve::EqualPower;
    }
    return std::nullopt;
}

const char* fadeCurveToString(FadeCurve curve) {
    switch (curve) {
    case FadeCurve::Linear:
        return "linear";
    case FadeCurve::Exponential:
        return "exponential";
    case FadeCurve::Logarithmic:
        return "logarithmic";
    case FadeCurve::SCurve:
        return "cosine";
    case FadeCurve::EqualPower:
        return "equal_power";
    }
    return "exponential";
}

}  // namespace segue::audio
