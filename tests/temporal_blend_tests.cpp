#include <gtest/gtest.h>

#include "shared/temporal_blend.hpp"

static TemporalBlurParams make_params(const float history_decay) {
    auto params = TemporalBlurParams{};
    params.history_decay = history_decay;
    params.scale = float2{1.f};
    return params;
}

TEST(TemporalBlend, ZeroDecayKeepsTheCurrentFrame) {
    const auto mixed = temporal_mix({0.8f, 0.2f, 0.1f}, {0.f, 1.f, 0.f}, make_params(0.f));

    EXPECT_FLOAT_EQ(mixed.x, 0.8f);
    EXPECT_FLOAT_EQ(mixed.y, 0.2f);
    EXPECT_FLOAT_EQ(mixed.z, 0.1f);
}

TEST(TemporalBlend, FullDecayKeepsTheHistory) {
    const auto mixed = temporal_mix({0.8f, 0.2f, 0.1f}, {0.f, 1.f, 0.f}, make_params(1.f));

    EXPECT_FLOAT_EQ(mixed.x, 0.f);
    EXPECT_FLOAT_EQ(mixed.y, 1.f);
    EXPECT_FLOAT_EQ(mixed.z, 0.f);
}

TEST(TemporalBlend, HalfDecayAverages) {
    const auto mixed = temporal_mix({1.f, 0.f, 0.5f}, {0.f, 1.f, 0.5f}, make_params(0.5f));

    EXPECT_FLOAT_EQ(mixed.x, 0.5f);
    EXPECT_FLOAT_EQ(mixed.y, 0.5f);
    EXPECT_FLOAT_EQ(mixed.z, 0.5f);
}

TEST(TemporalBlend, LuminanceUsesRec709Weights) {
    EXPECT_NEAR(temporal_luminance({1.f, 1.f, 1.f}), 1.f, 1e-6f);
    EXPECT_FLOAT_EQ(temporal_luminance({1.f, 0.f, 0.f}), 0.2126f);
    EXPECT_FLOAT_EQ(temporal_luminance({0.f, 1.f, 0.f}), 0.7152f);
    EXPECT_FLOAT_EQ(temporal_luminance({0.f, 0.f, 1.f}), 0.0722f);
}

TEST(TemporalBlend, DarkPixelsAreGatedToBlack) {
    EXPECT_EQ(temporal_brightness({0.f, 0.f, 0.f}), 0.f);
    EXPECT_EQ(temporal_brightness({0.04f, 0.04f, 0.04f}), 0.f);

    const auto display = temporal_display_color({0.03f, 0.03f, 0.03f});
    EXPECT_EQ(display.x, 0.f);
    EXPECT_EQ(display.w, 1.f);
}

TEST(TemporalBlend, BrightPixelsPassUnchanged) {
    EXPECT_EQ(temporal_brightness({0.5f, 0.5f, 0.5f}), 1.f);

    const auto display = temporal_display_color({0.6f, 0.4f, 0.9f});
    EXPECT_FLOAT_EQ(display.x, 0.6f);
    EXPECT_FLOAT_EQ(display.y, 0.4f);
    EXPECT_FLOAT_EQ(display.z, 0.9f);
    EXPECT_EQ(display.w, 1.f);
}

TEST(TemporalBlend, GateRampsBetweenThresholds) {
    const auto mid = temporal_brightness({0.2f, 0.2f, 0.2f});
    EXPECT_GT(mid, 0.f);
    EXPECT_LT(mid, 1.f);

    EXPECT_LT(temporal_brightness({0.1f, 0.1f, 0.1f}), temporal_brightness({0.3f, 0.3f, 0.3f}));
}

TEST(TemporalBlend, GateIsClosedAtTheLowThreshold) {
    const auto at_threshold = float3{TEMPORAL_GATE_LOW};
    ASSERT_NEAR(temporal_luminance(at_threshold), 0.05f, 1e-6f);

    EXPECT_NEAR(temporal_brightness(at_threshold), 0.f, 1e-6f);
    EXPECT_NEAR(temporal_display_color(at_threshold).x, 0.f, 1e-6f);

    EXPECT_GT(temporal_brightness(float3{0.06f}), 0.f);
}

TEST(TemporalBlend, GateIsOpenAtTheHighThreshold) {
    const auto at_threshold = float3{TEMPORAL_GATE_HIGH};
    ASSERT_NEAR(temporal_luminance(at_threshold), 0.35f, 1e-6f);

    EXPECT_NEAR(temporal_brightness(at_threshold), 1.f, 1e-6f);
    EXPECT_NEAR(temporal_display_color(at_threshold).x, 0.35f, 1e-6f);

    EXPECT_LT(temporal_brightness(float3{0.34f}), 1.f);
}

TEST(TemporalBlend, HistoryIsNotGated) {
    const auto history = temporal_history_color({0.01f, 0.02f, 0.03f});

    EXPECT_FLOAT_EQ(history.x, 0.01f);
    EXPECT_FLOAT_EQ(history.y, 0.02f);
    EXPECT_FLOAT_EQ(history.z, 0.03f);
    EXPECT_EQ(history.w, 1.f);
}

TEST(TemporalBlend, CurrentSampleIsJittered) {
    auto params = make_params(0.5f);
    params.jitter = float2{0.01f, -0.02f};
    params.scale = float2{2.f, 0.5f};

    const auto uv = temporal_current_uv({0.5f, 0.5f}, params);

    EXPECT_NEAR(uv.x, 0.52f, 1e-6f);
    EXPECT_NEAR(uv.y, 0.49f, 1e-6f);
}
