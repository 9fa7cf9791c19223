#ifndef STEREO_UV_HPP
#define STEREO_UV_HPP

#include "shared/prelude.h"
#include "shared/screen_params.hpp"

/**
 * Maps a screen UV to the UV of the source texel for the given view
 *
 * With a stereo flag set, each view reads its own half of the source along that axis. Which half belongs to which
 * view is decided by eye_offset, so swapping eyes only changes a parameter. The axis offsets mirror the source when
 * set to 1
 *
 * With a stereo flag cleared the whole source maps onto the screen for every view
 */
SHARED_FN float2 stereo_uv(float2 uv, uint view_index, ScreenParams params) {
    float2 divisor = float2(1.0f + params.stereo_x, 1.0f + params.stereo_y);
    float half_offset = abs(float(view_index) - params.eye_offset) / 2.0f;
    float2 eye_shift = float2(half_offset * params.stereo_x, half_offset * params.stereo_y);

    float2 mirrored = abs(uv - float2(params.x_offset, params.y_offset));
    return mirrored / divisor + eye_shift;
}

/**
 * Older mapping without eye swapping or mirroring. View 0 reads the first half, view 1 the second
 */
SHARED_FN float2 stereo_uv_legacy(float2 uv, uint view_index, ScreenParams params) {
    float2 divisor = float2(1.0f + params.stereo_x, 1.0f + params.stereo_y);
    float2 eye_shift = float2(float(view_index) * params.stereo_x, float(view_index) * params.stereo_y) / 2.0f;

    return uv / divisor + eye_shift;
}

#endif
