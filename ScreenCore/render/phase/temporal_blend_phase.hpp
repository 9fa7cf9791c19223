#pragma once

#include "render/backend/graphics_pipeline.hpp"
#include "render/backend/handles.hpp"

struct FrameUniforms;
class RenderGraph;

/**
 * Blends this frame's screen image with last frame's, darkening near-black pixels
 *
 * Writes the displayed image and next frame's history in the same pass. Both eyes are blended at once with multiview
 */
class TemporalBlendPhase {
public:
    TemporalBlendPhase();

    /**
     * Records the blend
     *
     * history_read and history_write must be different textures
     */
    void render(
        RenderGraph& graph, const FrameUniforms& uniforms, TextureHandle current, TextureHandle history_read,
        TextureHandle display_out, TextureHandle history_write
    ) const;

private:
    GraphicsPipelineHandle blend_pso = {};
};
