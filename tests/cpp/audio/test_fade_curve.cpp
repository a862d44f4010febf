#include "audio/fade_curve.h"

#include <cmath>
#include <gtest/gtest.h>

using namespace segue::audio;

namespace {

constexpr FadeCurve kAllCurves[] = {FadeCurve::Linear, FadeCurve::Exponential,
                                    FadeCurve::Logarithmic, FadeCurve::SCurve,
                                    FadeCurve::EqualPower};

}  // namespace

TEST(FadeCurve, EndpointsAreSilenceAndUnity) {
    for (FadeCurve curve : kAllCurves) {
        EXPECT_NEAR(fadeInGain(curve, 0.0), 0.0f, 1e-6f) << fadeCurveToString(curve);
        EXPECT_NEAR(fadeInGain(curve, 1.0), 1.0f, 1e-6f) << fadeCurveToString(curve);
        EXPECT_NEAR(fadeOutGain(curve, 0.0), 1.0f, 1e-6f) << fadeCurveToString(curve);
        EXPECT_NEAR(fadeOutGain(curve, 1.0), 0.0f, 1e-6f) << fadeCurveToString(curve);
    }
}

TEST(FadeCurve, FadeInIsMonotonic) {
    for (FadeCurve curve : kAllCurves) {
        float previous = -1.0f;
        for (int i = 0; i <= 100; ++i) {
            const float gain = fadeInGain(curve, i / 100.0);
            EXPECT_GE(gain, previous) << fadeCurveToString(curve) << " at " << i;
            previous = gain;
        }
    }
}

TEST(FadeCurve, ProgressIsClamped) {
    EXPECT_FLOAT_EQ(fadeInGain(FadeCurve::Linear, -0.5), 0.0f);
    EXPECT_FLOAT_EQ(fadeInGain(FadeCurve::Linear, 2.0), 1.0f);
    EXPECT_FLOAT_EQ(fadeOutGain(FadeCurve::Linear, 3.0), 0.0f);
}

TEST(FadeCurve, MidpointShapes) {
    EXPECT_NEAR(fadeInGain(FadeCurve::Linear, 0.5), 0.5f, 1e-6f);
    EXPECT_NEAR(fadeInGain(FadeCurve::Exponential, 0.5), 0.25f, 1e-6f);
    EXPECT_NEAR(fadeInGain(FadeCurve::Logarithmic, 0.25), 0.5f, 1e-6f);
    EXPECT_NEAR(fadeInGain(FadeCurve::SCurve, 0.5), 0.5f, 1e-6f);
    EXPECT_NEAR(fadeOutGain(FadeCurve::Exponential, 0.5), 0.25f, 1e-6f);
}

TEST(FadeCurve, EqualPowerKeepsConstantPower) {
    for (int i = 0; i <= 10; ++i) {
        const double t = i / 10.0;
        const float in = fadeInGain(FadeCurve::EqualPower, t);
        const float out = fadeOutGain(FadeCurve::EqualPower, t);
        EXPECT_NEAR(in * in + out * out, 1.0f, 1e-5f);
    }
}

TEST(FadeCurve, ParseAcceptsAliasesCaseInsensitively) {
    EXPECT_EQ(parseFadeCurve("Linear"), FadeCurve::Linear);
    EXPECT_EQ(parseFadeCurve("EXPONENTIAL"), FadeCurve::Exponential);
    EXPECT_EQ(parseFadeCurve("cosine"), FadeCurve::SCurve);
    EXPECT_EQ(parseFadeCurve("s-curve"), FadeCurve::SCurve);
    EXPECT_EQ(parseFadeCurve("equal_power"), FadeCurve::EqualPower);
    EXPECT_FALSE(parseFadeCurve("sawtooth").has_value());
    EXPECT_FALSE(parseFadeCurve("").has_value());
}

TEST(FadeCurve, NamesParseBack) {
    for (FadeCurve curve : kAllCurves) {
        EXPECT_EQ(parseFadeCurve(fadeCurveToString(curve)), curve);
    }
}
