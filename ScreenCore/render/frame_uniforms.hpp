#pragma once

#include "render/backend/handles.hpp"

/**
 * Uniform buffers holding one FrameSnapshot on the GPU
 *
 * ScreenRenderer keeps one set per frame in flight and uploads the snapshot at the start of the frame, before any
 * phase reads it
 */
struct FrameUniforms {
    BufferHandle screen = nullptr;

    BufferHandle cameras = nullptr;

    BufferHandle model = nullptr;

    BufferHandle temporal = nullptr;
};
