#ifndef SCREEN_VERTEX_HPP
#define SCREEN_VERTEX_HPP

#include "shared/prelude.h"

struct ScreenVertex {
    float3 position;
    float2 texcoord;
};

#endif
