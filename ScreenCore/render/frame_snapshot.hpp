#pragma once

#include <cstdint>

#include <glm/vec2.hpp>

#include "core/stereo_mode.hpp"
#include "render/screen_render_strategy.hpp"
#include "render/screen_settings.hpp"
#include "shared/camera_data.hpp"
#include "shared/screen_params.hpp"
#include "shared/temporal_blur_params.hpp"

struct AppConfig;
class CameraArray;
class ScreenTransform;

/**
 * Everything the passes of one frame read from the CPU
 *
 * Built once at the start of the frame and handed to each phase by const reference. Nothing in here changes while
 * the frame is being recorded
 */
struct FrameSnapshot {
    ScreenParams screen = {};

    CameraUniform cameras = {};

    ModelUniform model = {};

    TemporalBlurParams temporal = {};

    /**
     * Screen variant to draw. Its mapping comes from the settings
     */
    ScreenRenderStrategy strategy = {};

    /**
     * The r.Screen.* cvars as they were when the frame began
     */
    ScreenSettings settings = {};

    uint64_t frame_index = 0;
};

/**
 * Gathers this frame's uniforms
 *
 * The jitter walks a Halton (2, 3) sequence of settings.jitter_sequence_length points, scaled by settings.jitter_scale.
 * It's zero when jitter is disabled. History decay is clamped to [0, 1] here, the shader uses it as-is
 *
 * The settings and strategy are copied in, so that the whole frame is recorded with one generation of settings
 */
FrameSnapshot build_frame_snapshot(
    const AppConfig& config, const CameraArray& cameras, const ScreenTransform& screen, const ScreenSettings& settings,
    const ScreenRenderStrategy& strategy, StereoMode stereo_mode, glm::uvec2 output_resolution, uint64_t frame_index
);
