#ifndef CURVATURE_HPP
#define CURVATURE_HPP

#include "shared/prelude.h"
#include "shared/screen_params.hpp"

/**
 * Depth offset of the screen surface at the given UV. Never positive, so the surface only moves away from the viewer
 *
 * Each axis contributes its full curvature at the center of the screen and nothing at its borders. The two
 * contributions add
 */
SHARED_FN float curvature_offset(float2 uv, ScreenParams params) {
    float dx = (uv.x - 0.5f) * 2.0f;
    float dy = (uv.y - 0.5f) * 2.0f;

    return -(1.0f - dx * dx) * params.x_curvature - (1.0f - dy * dy) * params.y_curvature;
}

SHARED_FN float3 curve_position(float3 position, float2 uv, ScreenParams params) {
    return float3(position.x, position.y, position.z + curvature_offset(uv, params));
}

#endif
