#include <gtest/gtest.h>

#include "shared/stereo_uv.hpp"

static ScreenParams make_params(const float stereo_x, const float eye_offset) {
    auto params = ScreenParams{};
    params.stereo_x = stereo_x;
    params.eye_offset = eye_offset;
    return params;
}

TEST(StereoUv, MonoSourceIsIdentityForEveryView) {
    const auto params = make_params(0.f, 1.f);

    for(auto view_index = 0u; view_index < 2; view_index++) {
        for(const auto uv : {float2{0.f, 0.f}, float2{0.3f, 0.7f}, float2{1.f, 1.f}}) {
            const auto mapped = stereo_uv(uv, view_index, params);
            EXPECT_FLOAT_EQ(mapped.x, uv.x);
            EXPECT_FLOAT_EQ(mapped.y, uv.y);
        }
    }
}

TEST(StereoUv, SwappedEyesReadOppositeHalves) {
    const auto params = make_params(1.f, 1.f);

    // View 0 reads the right half, view 1 the left half
    for(const auto u : {0.f, 0.1f, 0.5f, 0.9f, 1.f}) {
        const auto view_0 = stereo_uv({u, 0.5f}, 0, params);
        const auto view_1 = stereo_uv({u, 0.5f}, 1, params);

        EXPECT_GE(view_0.x, 0.5f);
        EXPECT_LE(view_0.x, 1.f);
        EXPECT_GE(view_1.x, 0.f);
        EXPECT_LE(view_1.x, 0.5f);
        EXPECT_FLOAT_EQ(view_0.x - view_1.x, 0.5f);
    }
}

TEST(StereoUv, UnswappedEyesReadTheirOwnHalves) {
    const auto params = make_params(1.f, 0.f);

    EXPECT_FLOAT_EQ(stereo_uv({0.5f, 0.5f}, 0, params).x, 0.25f);
    EXPECT_FLOAT_EQ(stereo_uv({0.5f, 0.5f}, 1, params).x, 0.75f);
}

TEST(StereoUv, OffsetMirrorsTheSource) {
    auto params = make_params(0.f, 0.f);
    params.x_offset = 1.f;
    params.y_offset = 1.f;

    const auto mapped = stereo_uv({0.2f, 0.9f}, 0, params);

    EXPECT_FLOAT_EQ(mapped.x, 0.8f);
    EXPECT_NEAR(mapped.y, 0.1f, 1e-6f);
}

TEST(StereoUv, VerticalStereoSplitsRows) {
    auto params = make_params(0.f, 0.f);
    params.stereo_y = 1.f;

    EXPECT_FLOAT_EQ(stereo_uv({0.4f, 1.f}, 0, params).y, 0.5f);
    EXPECT_FLOAT_EQ(stereo_uv({0.4f, 0.f}, 1, params).y, 0.5f);
    EXPECT_FLOAT_EQ(stereo_uv({0.4f, 1.f}, 0, params).x, 0.4f);
}

TEST(StereoUvLegacy, HalvesByViewIndex) {
    // The legacy mapping ignores eye_offset
    const auto params = make_params(1.f, 1.f);

    EXPECT_FLOAT_EQ(stereo_uv_legacy({0.f, 0.5f}, 0, params).x, 0.f);
    EXPECT_FLOAT_EQ(stereo_uv_legacy({1.f, 0.5f}, 0, params).x, 0.5f);
    EXPECT_FLOAT_EQ(stereo_uv_legacy({0.f, 0.5f}, 1, params).x, 0.5f);
    EXPECT_FLOAT_EQ(stereo_uv_legacy({1.f, 0.5f}, 1, params).x, 1.f);
}

TEST(StereoUvLegacy, MatchesSymmetricWithoutSwapOrMirror) {
    const auto params = make_params(1.f, 0.f);

    for(auto view_index = 0u; view_index < 2; view_index++) {
        for(const auto u : {0.f, 0.33f, 0.66f, 1.f}) {
            const auto legacy = stereo_uv_legacy({u, 0.25f}, view_index, params);
            const auto symmetric = stereo_uv({u, 0.25f}, view_index, params);
            EXPECT_FLOAT_EQ(legacy.x, symmetric.x);
            EXPECT_FLOAT_EQ(legacy.y, symmetric.y);
        }
    }
}
