#include <gtest/gtest.h>

#include "cpu_image.hpp"
#include "shared/ambient_vignette.hpp"

/**
 * Runs the ambient blur the way ambient.frag does, on a CPU image
 */
static float3 blur(const CpuImage& image, const float2 uv, const ScreenParams& params) {
    const auto texel_step = ambient_texel_step(params);

    auto blurred = float3{0};
    for(auto tap = 0; tap < AMBIENT_TAP_COUNT; tap++) {
        blurred += image.sample(uv + ambient_tap_offset(tap) * texel_step) * ambient_tap_weight(tap);
    }
    return blurred;
}

static ScreenParams make_params(const uint32_t ambient_width, const float aspect_ratio) {
    auto params = ScreenParams{};
    params.ambient_width = ambient_width;
    params.aspect_ratio = aspect_ratio;
    return params;
}

TEST(AmbientVignette, CenterIsUnattenuated) {
    EXPECT_EQ(ambient_vignette({0.5f, 0.5f}), 1.f);
    EXPECT_EQ(ambient_vignette({0.8f, 0.5f}), 1.f);
    EXPECT_EQ(ambient_vignette({0.5f, 0.16f}), 1.f);
}

TEST(AmbientVignette, FadesOutByTheEdges) {
    EXPECT_EQ(ambient_vignette({0.f, 0.5f}), 0.f);
    EXPECT_EQ(ambient_vignette({0.5f, 1.f}), 0.f);
    EXPECT_EQ(ambient_vignette({0.f, 0.f}), 0.f);

    const auto partial = ambient_vignette({0.9f, 0.5f});
    EXPECT_GT(partial, 0.f);
    EXPECT_LT(partial, 1.f);
}

TEST(AmbientVignette, FullStrengthOutToTheInnerRadius) {
    EXPECT_NEAR(ambient_vignette({0.5f + AMBIENT_VIGNETTE_INNER, 0.5f}), 1.f, 1e-5f);
    EXPECT_NEAR(ambient_vignette({0.5f, 0.5f - AMBIENT_VIGNETTE_INNER}), 1.f, 1e-5f);

    EXPECT_LT(ambient_vignette({0.5f + AMBIENT_VIGNETTE_INNER + 0.02f, 0.5f}), 1.f);
}

TEST(AmbientVignette, ZeroFromTheOuterRadiusOn) {
    EXPECT_EQ(ambient_vignette({0.5f + AMBIENT_VIGNETTE_OUTER, 0.5f}), 0.f);
    EXPECT_EQ(ambient_vignette({0.5f, 0.5f - AMBIENT_VIGNETTE_OUTER}), 0.f);

    // Corners are further out than any edge midpoint
    EXPECT_EQ(ambient_vignette({1.f, 1.f}), 0.f);
    EXPECT_EQ(ambient_vignette({0.9f, 0.9f}), 0.f);

    EXPECT_GT(ambient_vignette({0.5f + AMBIENT_VIGNETTE_OUTER - 0.02f, 0.5f}), 0.f);
}

TEST(AmbientVignette, ClampsUvsOutsideTheImage) {
    EXPECT_EQ(ambient_vignette({-3.f, 0.5f}), ambient_vignette({0.f, 0.5f}));
    EXPECT_EQ(ambient_vignette({0.5f, 7.f}), ambient_vignette({0.5f, 1.f}));
}

TEST(AmbientKernel, WeightsMatchTheBinomialKernel) {
    for(const auto corner : {0, 2, 6, 8}) {
        EXPECT_FLOAT_EQ(ambient_tap_weight(corner), 0.0625f);
    }
    for(const auto edge : {1, 3, 5, 7}) {
        EXPECT_FLOAT_EQ(ambient_tap_weight(edge), 0.125f);
    }
    EXPECT_FLOAT_EQ(ambient_tap_weight(4), 0.25f);
}

TEST(AmbientKernel, WeightsSumToOne) {
    auto sum = 0.f;
    for(auto tap = 0; tap < AMBIENT_TAP_COUNT; tap++) {
        sum += ambient_tap_weight(tap);
    }

    EXPECT_FLOAT_EQ(sum, 1.f);
}

TEST(AmbientKernel, TapsCoverTheNeighborhood) {
    EXPECT_EQ(ambient_tap_offset(0), float2(-1.f, -1.f));
    EXPECT_EQ(ambient_tap_offset(4), float2(0.f, 0.f));
    EXPECT_EQ(ambient_tap_offset(5), float2(1.f, 0.f));
    EXPECT_EQ(ambient_tap_offset(8), float2(1.f, 1.f));
}

TEST(AmbientKernel, StepFollowsWidthAndAspectRatio) {
    const auto step = ambient_texel_step(make_params(256, 2.f));

    EXPECT_FLOAT_EQ(step.x, 1.f / 256.f);
    EXPECT_FLOAT_EQ(step.y, 2.f / 256.f);
}

TEST(AmbientKernel, ConstantImageStaysConstant) {
    const auto color = float3{0.3f, 0.6f, 0.9f};
    const auto image = CpuImage{64, 32, color};
    const auto params = make_params(16, 16.f / 9.f);

    for(const auto uv : {float2{0.5f, 0.5f}, float2{0.f, 0.f}, float2{1.f, 0.3f}, float2{0.01f, 0.99f}}) {
        const auto blurred = blur(image, uv, params);
        EXPECT_NEAR(blurred.x, color.x, 1e-5f);
        EXPECT_NEAR(blurred.y, color.y, 1e-5f);
        EXPECT_NEAR(blurred.z, color.z, 1e-5f);
    }
}

TEST(AmbientKernel, SpreadsASingleBrightTexel) {
    auto image = CpuImage{8, 8, float3{0}};
    image.set(4, 4, float3{1});

    // Steps of exactly one texel, so each tap lands on a texel center
    const auto params = make_params(8, 1.f);
    const auto center_uv = float2{4.5f / 8.f, 4.5f / 8.f};

    EXPECT_NEAR(blur(image, center_uv, params).x, 0.25f, 1e-5f);
    EXPECT_NEAR(blur(image, center_uv + float2{1.f / 8.f, 0.f}, params).x, 0.125f, 1e-5f);
    EXPECT_NEAR(blur(image, center_uv + float2{1.f / 8.f, 1.f / 8.f}, params).x, 0.0625f, 1e-5f);
}
