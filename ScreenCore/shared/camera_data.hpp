#ifndef CAMERA_DATA_HPP
#define CAMERA_DATA_HPP

#include "shared/prelude.h"

#define NUM_EYE_VIEWS 2

struct CameraUniform {
    float4x4 view_proj[NUM_EYE_VIEWS];
};

struct ModelUniform {
    float4x4 model;
};

#endif
