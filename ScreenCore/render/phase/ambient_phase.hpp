#pragma once

#include "render/backend/graphics_pipeline.hpp"
#include "render/backend/handles.hpp"

struct FrameUniforms;
class RenderGraph;

/**
 * Renders a blurred, vignetted copy of the left eye's image, to light the space around the screen
 */
class AmbientPhase {
public:
    AmbientPhase();

    /**
     * @param blended Output of the temporal blend. Only layer 0 is read
     * @param ambient_out Single-layer target
     */
    void render(
        RenderGraph& graph, const FrameUniforms& uniforms, TextureHandle blended, TextureHandle ambient_out
    ) const;

private:
    GraphicsPipelineHandle ambient_pso = {};
};
