#include <gtest/gtest.h>

#include "core/app_config.hpp"
#include "render/plane_mesh.hpp"
#include "render/screen_transform.hpp"
#include "shared/curvature.hpp"
#include "shared/stereo_uv.hpp"

// Runs a side-by-side frame through the same math the curved screen shaders run, with the default config

TEST(CurvedScreen, DefaultConfigBowsTheCenterAwayFromTheViewer) {
    const auto config = AppConfig{};
    const auto params = config.to_screen_params(16.f / 9.f, StereoMode::SideBySide, 1920, 256);
    const auto mesh = generate_plane_mesh(101, 101, 1.f, 1.f, 0.f);

    const auto& center = mesh.vertices[50 * 101 + 50];
    ASSERT_FLOAT_EQ(center.texcoord.x, 0.5f);
    ASSERT_FLOAT_EQ(center.texcoord.y, 0.5f);

    const auto curved_center = curve_position(center.position, center.texcoord, params);
    EXPECT_NEAR(curved_center.z, -0.48f, 1e-5f);

    // Corners stay on the plane
    for(const auto& corner : {mesh.vertices.front(), mesh.vertices.back()}) {
        EXPECT_NEAR(curve_position(corner.position, corner.texcoord, params).z, 0.f, 1e-5f);
    }

    // Every vertex moves along -z, away from a viewer looking down -z, and none moves closer
    for(const auto& vertex : mesh.vertices) {
        const auto curved = curve_position(vertex.position, vertex.texcoord, params);
        EXPECT_LE(curved.z, 1e-6f);
        EXPECT_GE(curved.z, -0.48f - 1e-5f);
    }
}

TEST(CurvedScreen, ModelTransformScalesTheBow) {
    const auto config = AppConfig{};
    const auto params = config.to_screen_params(16.f / 9.f, StereoMode::SideBySide, 1920, 256);
    const auto transform = ScreenTransform{config.distance, config.scale, 16.f / 9.f};

    const auto curved_center = curve_position({0.f, 0.f, 0.f}, {0.5f, 0.5f}, params);
    const auto world_center = transform.get_model_matrix() * glm::vec4{curved_center, 1.f};

    EXPECT_NEAR(world_center.x, 0.f, 1e-5f);
    EXPECT_NEAR(world_center.y, 0.f, 1e-5f);
    EXPECT_NEAR(world_center.z, -config.distance - 0.48f * config.scale / 2.f, 1e-4f);

    // The corners stay on the plane, nearer to the viewer than the center
    const auto world_corner = transform.get_model_matrix() * glm::vec4{-0.5f, -0.5f, 0.f, 1.f};
    EXPECT_NEAR(world_corner.z, -config.distance, 1e-4f);
    EXPECT_LT(world_center.z, world_corner.z);
}

TEST(CurvedScreen, EachEyeSeesItsOwnHalf) {
    const auto config = AppConfig{};
    const auto params = config.to_screen_params(16.f / 9.f, StereoMode::SideBySide, 1920, 256);
    const auto mesh = generate_plane_mesh(11, 11, 1.f, 1.f, 0.f);

    // Eyes are swapped by default, so the left eye reads the right half
    for(const auto& vertex : mesh.vertices) {
        const auto left_eye = stereo_uv(vertex.texcoord, 0, params);
        const auto right_eye = stereo_uv(vertex.texcoord, 1, params);

        EXPECT_GE(left_eye.x, 0.5f);
        EXPECT_LE(left_eye.x, 1.f);
        EXPECT_GE(right_eye.x, 0.f);
        EXPECT_LE(right_eye.x, 0.5f);

        EXPECT_FLOAT_EQ(left_eye.y, vertex.texcoord.y);
        EXPECT_FLOAT_EQ(right_eye.y, vertex.texcoord.y);
    }
}

TEST(CurvedScreen, FlippingASideBySideFrameKeepsEyesOnTheirImages) {
    auto config = AppConfig{};
    config.toggle_flip_x(StereoMode::SideBySide);
    const auto params = config.to_screen_params(16.f / 9.f, StereoMode::SideBySide, 1920, 256);

    // Mirrored and unswapped: the left eye reads the left half, right to left
    EXPECT_FLOAT_EQ(stereo_uv({0.f, 0.5f}, 0, params).x, 0.5f);
    EXPECT_FLOAT_EQ(stereo_uv({1.f, 0.5f}, 0, params).x, 0.f);
    EXPECT_FLOAT_EQ(stereo_uv({0.f, 0.5f}, 1, params).x, 1.f);
    EXPECT_FLOAT_EQ(stereo_uv({1.f, 0.5f}, 1, params).x, 0.5f);
}
