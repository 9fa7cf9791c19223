#ifndef AMBIENT_VIGNETTE_HPP
#define AMBIENT_VIGNETTE_HPP

#include "shared/prelude.h"
#include "shared/screen_params.hpp"

#define AMBIENT_TAP_COUNT 9
#define AMBIENT_VIGNETTE_INNER 0.35f
#define AMBIENT_VIGNETTE_OUTER 0.5f

SHARED_FN float ambient_vignette(float2 uv) {
    float distance_from_center = length(clamp(uv, 0.0f, 1.0f) - float2(0.5f));
    return 1.0f - smoothstep(AMBIENT_VIGNETTE_INNER, AMBIENT_VIGNETTE_OUTER, distance_from_center);
}

/**
 * Offset of the tap in texels. Taps walk a 3x3 grid row by row, tap 4 is the center
 */
SHARED_FN float2 ambient_tap_offset(int tap) {
    return float2(float(tap % 3) - 1.0f, float(tap / 3) - 1.0f);
}

/**
 * Separable [1 2 1] / 4 kernel: 0.0625 on the corners, 0.125 on the edges, 0.25 in the center
 */
SHARED_FN float ambient_tap_weight(int tap) {
    float2 offset = ambient_tap_offset(tap);
    return (0.5f - 0.25f * abs(offset.x)) * (0.5f - 0.25f * abs(offset.y));
}

/**
 * Size of one blur step in UV units. The vertical step is scaled by the aspect ratio so the blur stays round on
 * screen
 */
SHARED_FN float2 ambient_texel_step(ScreenParams params) {
    float width = float(params.ambient_width);
    return float2(1.0f / width, params.aspect_ratio / width);
}

#endif
