#pragma once

#include <cstdint>

#include "render/screen_render_strategy.hpp"

/**
 * Values of the r.Screen.* console variables, sanitized for use in one frame
 */
struct ScreenSettings {
    float history_decay = 0.5f;

    uint32_t ambient_width = 256;

    bool ambient_enabled = true;

    StereoMapping stereo_mapping = StereoMapping::Symmetric;

    bool jitter_enabled = true;

    uint32_t jitter_sequence_length = 16;

    float jitter_scale = 1.f;

    bool flat_background_enabled = false;

    /**
     * Number of vertices along each side of the curved screen mesh
     */
    uint32_t mesh_resolution = 100;

    /**
     * Reads the cvars. Integer cvars below their minimum useful value are raised to it
     */
    static ScreenSettings get();

    static void set_ambient_enabled(bool enabled);

    static void set_flat_background_enabled(bool enabled);

    static void set_stereo_mapping(StereoMapping mapping);
};
