#ifndef TEMPORAL_BLEND_HPP
#define TEMPORAL_BLEND_HPP

#include "shared/prelude.h"
#include "shared/temporal_blur_params.hpp"

#define TEMPORAL_GATE_LOW 0.05f
#define TEMPORAL_GATE_HIGH 0.35f

SHARED_FN float2 temporal_current_uv(float2 uv, TemporalBlurParams params) {
    return uv + params.jitter * params.scale;
}

SHARED_FN float3 temporal_mix(float3 current, float3 history, TemporalBlurParams params) {
    return mix(current, history, params.history_decay);
}

SHARED_FN float temporal_luminance(float3 color) {
    return dot(color, float3(0.2126f, 0.7152f, 0.0722f));
}

/**
 * Fades dark pixels out so that history can't slowly accumulate codec noise in near-black regions
 */
SHARED_FN float temporal_brightness(float3 mixed) {
    return smoothstep(TEMPORAL_GATE_LOW, TEMPORAL_GATE_HIGH, temporal_luminance(mixed));
}

SHARED_FN float4 temporal_display_color(float3 mixed) {
    return float4(mixed * temporal_brightness(mixed), 1.0f);
}

SHARED_FN float4 temporal_history_color(float3 mixed) {
    return float4(mixed, 1.0f);
}

#endif
