#ifndef TEMPORAL_BLUR_PARAMS_HPP
#define TEMPORAL_BLUR_PARAMS_HPP

#include "shared/prelude.h"

struct TemporalBlurParams {
    /**
     * Sub-pixel offset of this frame's sample, in UV units before scaling
     */
    float2 jitter;

    float2 scale;

    float2 resolution;

    /**
     * Weight of the history in the blend. Clamped to [0, 1] on the CPU before upload
     */
    float history_decay;

    float padding;
};

#endif
