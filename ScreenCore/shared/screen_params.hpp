#ifndef SCREEN_PARAMS_HPP
#define SCREEN_PARAMS_HPP

#include "shared/prelude.h"

/**
 * Parameters of the virtual screen and of the side-by-side source it displays
 *
 * Uploaded once per frame as part of the frame snapshot
 */
struct ScreenParams {
    /**
     * How far the center of the screen bows away from the viewer, along -z, for each axis. Zero for a flat screen
     */
    float x_curvature;
    float y_curvature;

    /**
     * View index used as the mirror axis when picking a half of the source. 0 for normal eyes, 1 for swapped eyes
     */
    float eye_offset;

    /**
     * 1 to mirror the source along that axis, 0 to sample it as-is
     */
    float y_offset;
    float x_offset;

    /**
     * Width / height of one eye's image in the source
     */
    float aspect_ratio;

    uint screen_width;

    /**
     * Denominator for the ambient blur's horizontal step size
     */
    uint ambient_width;

    /**
     * 1.0 when the source is split into per-eye halves along that axis, 0.0 otherwise
     */
    float stereo_x;
    float stereo_y;

    float padding0;
    float padding1;
};

#endif
