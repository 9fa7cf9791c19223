#include "frame_snapshot.hpp"

#include <glm/common.hpp>

#include "core/app_config.hpp"
#include "core/halton_sequence.hpp"
#include "render/camera_array.hpp"
#include "render/screen_transform.hpp"

FrameSnapshot build_frame_snapshot(
    const AppConfig& config, const CameraArray& cameras, const ScreenTransform& screen, const ScreenSettings& settings,
    const ScreenRenderStrategy& strategy, const StereoMode stereo_mode, const glm::uvec2 output_resolution,
    const uint64_t frame_index
) {
    const auto resolution = glm::vec2{output_resolution};

    auto jitter = glm::vec2{0};
    if(settings.jitter_enabled && output_resolution.x > 0 && output_resolution.y > 0) {
        // Halton index 0 is the origin of the sequence, so we start at 1
        const auto jitter_index = static_cast<uint32_t>(frame_index % settings.jitter_sequence_length) + 1;
        jitter = get_jitter(jitter_index, resolution);
    }

    auto frame_strategy = strategy;
    frame_strategy.mapping = settings.stereo_mapping;

    return FrameSnapshot{
        .screen = config.to_screen_params(
            screen.get_aspect_ratio(),
            stereo_mode,
            output_resolution.x,
            settings.ambient_width),
        .cameras = cameras.get_gpu_data(),
        .model = screen.get_gpu_data(),
        .temporal = {
            .jitter = jitter,
            .scale = glm::vec2{settings.jitter_scale},
            .resolution = resolution,
            .history_decay = glm::clamp(settings.history_decay, 0.f, 1.f),
        },
        .strategy = frame_strategy,
        .settings = settings,
        .frame_index = frame_index,
    };
}
