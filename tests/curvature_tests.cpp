#include <gtest/gtest.h>

#include "shared/curvature.hpp"

static ScreenParams make_params(const float x_curvature, const float y_curvature) {
    auto params = ScreenParams{};
    params.x_curvature = x_curvature;
    params.y_curvature = y_curvature;
    return params;
}

TEST(Curvature, CenterBowsByBothAxes) {
    const auto params = make_params(0.4f, 0.08f);

    EXPECT_NEAR(curvature_offset({0.5f, 0.5f}, params), -0.48f, 1e-6f);
}

TEST(Curvature, BordersDropTheirAxis) {
    const auto params = make_params(0.4f, 0.08f);

    // Left and right edges keep only the vertical bow
    EXPECT_NEAR(curvature_offset({0.f, 0.5f}, params), -0.08f, 1e-6f);
    EXPECT_NEAR(curvature_offset({1.f, 0.5f}, params), -0.08f, 1e-6f);

    // Top and bottom edges keep only the horizontal bow
    EXPECT_NEAR(curvature_offset({0.5f, 0.f}, params), -0.4f, 1e-6f);
    EXPECT_NEAR(curvature_offset({0.5f, 1.f}, params), -0.4f, 1e-6f);

    EXPECT_NEAR(curvature_offset({0.f, 0.f}, params), 0.f, 1e-6f);
    EXPECT_NEAR(curvature_offset({1.f, 1.f}, params), 0.f, 1e-6f);
}

TEST(Curvature, ZeroCurvatureIsFlat) {
    const auto params = make_params(0.f, 0.f);

    for(const auto uv : {float2{0.f, 0.f}, float2{0.25f, 0.75f}, float2{0.5f, 0.5f}, float2{1.f, 0.3f}}) {
        EXPECT_EQ(curvature_offset(uv, params), 0.f);
    }
}

TEST(Curvature, IsSymmetricAboutTheCenter) {
    const auto params = make_params(0.3f, 0.2f);

    EXPECT_NEAR(curvature_offset({0.2f, 0.4f}, params), curvature_offset({0.8f, 0.6f}, params), 1e-6f);
}

TEST(Curvature, CurvePositionOnlyMovesDepth) {
    const auto params = make_params(0.4f, 0.08f);

    const auto curved = curve_position({0.25f, -0.5f, 2.f}, {0.5f, 0.5f}, params);

    EXPECT_FLOAT_EQ(curved.x, 0.25f);
    EXPECT_FLOAT_EQ(curved.y, -0.5f);
    EXPECT_NEAR(curved.z, 2.f - 0.48f, 1e-6f);
}
