#include <gtest/gtest.h>

#include "core/app_config.hpp"
#include "core/halton_sequence.hpp"
#include "render/camera_array.hpp"
#include "render/frame_snapshot.hpp"
#include "render/screen_settings.hpp"
#include "render/screen_transform.hpp"

TEST(Halton, RadicalInverse) {
    EXPECT_FLOAT_EQ(halton(0, 2), 0.f);
    EXPECT_FLOAT_EQ(halton(1, 2), 0.5f);
    EXPECT_FLOAT_EQ(halton(2, 2), 0.25f);
    EXPECT_FLOAT_EQ(halton(3, 2), 0.75f);
    EXPECT_FLOAT_EQ(halton(1, 3), 1.f / 3.f);
    EXPECT_FLOAT_EQ(halton(2, 3), 2.f / 3.f);
    EXPECT_FLOAT_EQ(halton(4, 3), 4.f / 9.f);
}

TEST(Halton, JitterStaysWithinOnePixel) {
    const auto resolution = glm::vec2{1920.f, 1080.f};

    for(auto index = 1u; index <= 64; index++) {
        const auto jitter = get_jitter(index, resolution);
        EXPECT_GE(jitter.x, -1.f / resolution.x);
        EXPECT_LT(jitter.x, 1.f / resolution.x);
        EXPECT_GE(jitter.y, -1.f / resolution.y);
        EXPECT_LT(jitter.y, 1.f / resolution.y);
    }
}

class FrameSnapshotTest : public testing::Test {
protected:
    AppConfig config = {};

    CameraArray cameras = {};

    ScreenTransform screen = ScreenTransform{20.f, 40.f, 16.f / 9.f};

    ScreenSettings settings = {};

    ScreenRenderStrategy strategy = {};

    FrameSnapshot build_mono(const uint64_t frame_index) const {
        return build_frame_snapshot(
            config,
            cameras,
            screen,
            settings,
            strategy,
            StereoMode::Mono,
            resolution,
            frame_index);
    }

    glm::uvec2 resolution = {1920, 1080};
};

TEST_F(FrameSnapshotTest, CopiesTheScreenAndCameras) {
    const auto snapshot = build_frame_snapshot(
        config,
        cameras,
        screen,
        settings,
        strategy,
        StereoMode::SideBySide,
        resolution,
        7);

    EXPECT_EQ(snapshot.frame_index, 7u);
    EXPECT_FLOAT_EQ(snapshot.screen.aspect_ratio, 16.f / 9.f);
    EXPECT_EQ(snapshot.screen.screen_width, 1920u);
    EXPECT_EQ(snapshot.screen.ambient_width, settings.ambient_width);
    EXPECT_EQ(snapshot.screen.stereo_x, 1.f);
    EXPECT_EQ(snapshot.screen.eye_offset, 1.f);
    EXPECT_EQ(snapshot.model.model, screen.get_model_matrix());
    EXPECT_EQ(snapshot.cameras.view_proj[0], cameras.get_gpu_data().view_proj[0]);
    EXPECT_EQ(snapshot.cameras.view_proj[1], cameras.get_gpu_data().view_proj[1]);
    EXPECT_EQ(snapshot.temporal.resolution, glm::vec2(1920.f, 1080.f));
}

TEST_F(FrameSnapshotTest, CarriesTheFrameSettings) {
    settings.ambient_enabled = false;
    settings.flat_background_enabled = true;
    settings.mesh_resolution = 32;
    settings.stereo_mapping = StereoMapping::Legacy;
    strategy = {.geometry = ScreenGeometry::Flat, .view_mode = ViewMode::Mono, .mapping = StereoMapping::Symmetric};

    const auto snapshot = build_frame_snapshot(
        config,
        cameras,
        screen,
        settings,
        strategy,
        StereoMode::SideBySide,
        resolution,
        0);

    EXPECT_FALSE(snapshot.settings.ambient_enabled);
    EXPECT_TRUE(snapshot.settings.flat_background_enabled);
    EXPECT_EQ(snapshot.settings.mesh_resolution, 32u);
    EXPECT_EQ(snapshot.strategy.geometry, ScreenGeometry::Flat);
    EXPECT_EQ(snapshot.strategy.view_mode, ViewMode::Mono);
    // The mapping always follows the settings, so the frame can't mix two of them
    EXPECT_EQ(snapshot.strategy.mapping, StereoMapping::Legacy);

    // Later changes to the settings don't reach a snapshot that was already built
    settings.ambient_enabled = true;
    EXPECT_FALSE(snapshot.settings.ambient_enabled);
}

TEST_F(FrameSnapshotTest, ClampsHistoryDecay) {
    settings.history_decay = 1.5f;
    EXPECT_EQ(build_mono(0).temporal.history_decay, 1.f);

    settings.history_decay = -0.25f;
    EXPECT_EQ(build_mono(0).temporal.history_decay, 0.f);

    settings.history_decay = 0.3f;
    EXPECT_FLOAT_EQ(build_mono(0).temporal.history_decay, 0.3f);
}

TEST_F(FrameSnapshotTest, JitterFollowsTheHaltonSequence) {
    settings.jitter_scale = 0.5f;

    const auto first = build_mono(0);
    const auto expected = get_jitter(1, glm::vec2{resolution});
    EXPECT_EQ(first.temporal.jitter, expected);
    EXPECT_EQ(first.temporal.scale, glm::vec2(0.5f));

    const auto second = build_mono(1);
    EXPECT_NE(second.temporal.jitter, first.temporal.jitter);
}

TEST_F(FrameSnapshotTest, JitterRepeatsAfterTheSequenceLength) {
    settings.jitter_sequence_length = 4;

    const auto first = build_mono(2);
    const auto repeated = build_mono(6);

    EXPECT_EQ(first.temporal.jitter, repeated.temporal.jitter);
}

TEST_F(FrameSnapshotTest, DisabledJitterIsZero) {
    settings.jitter_enabled = false;

    for(auto frame = 0u; frame < 4; frame++) {
        EXPECT_EQ(build_mono(frame).temporal.jitter, glm::vec2(0.f));
    }
}

TEST_F(FrameSnapshotTest, ZeroResolutionHasNoJitter) {
    const auto snapshot = build_frame_snapshot(
        config,
        cameras,
        screen,
        settings,
        strategy,
        StereoMode::Mono,
        glm::uvec2{0},
        3);

    EXPECT_EQ(snapshot.temporal.jitter, glm::vec2(0.f));
}
