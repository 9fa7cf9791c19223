#pragma once

#include <glm/vec2.hpp>

/**
 * Layout of the captured frame
 */
enum class StereoMode {
    /**
     * One image for both eyes
     */
    Mono,

    /**
     * Left eye in the left half, right eye in the right half
     */
    SideBySide,
};

/**
 * Aspect ratio of the image one eye sees. Side-by-side frames pack two eyes into one width
 */
float get_eye_aspect_ratio(glm::uvec2 source_resolution, StereoMode mode);
