#ifndef PRELUDE_H
#define PRELUDE_H

#if defined(__cplusplus)

// Typedefs so we can share structs and shading functions between C++ and GLSL

#include <cstdint>

#include <glm/glm.hpp>
#include <glm/gtx/compatibility.hpp>

using uint = uint32_t;
using uint2 = glm::uvec2;
using uint4 = glm::uvec4;

using glm::float2;
using glm::float3;
using glm::float4;
using glm::float4x4;

// GLSL builtins the shared functions use
using glm::abs;
using glm::clamp;
using glm::dot;
using glm::length;
using glm::mix;
using glm::smoothstep;

#define SHARED_FN inline

#elif defined(GL_core_profile)

#define uint2 uvec2
#define uint4 uvec4

#define float2 vec2
#define float3 vec3
#define float4 vec4
#define float4x4 mat4

#define SHARED_FN

#endif

#ifndef PI
#define PI 3.1415927
#endif

#endif
