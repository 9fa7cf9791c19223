#pragma once

#include <array>
#include <cstdint>

#include "render/backend/graphics_pipeline.hpp"
#include "render/backend/handles.hpp"
#include "render/screen_render_strategy.hpp"

struct FrameUniforms;
class RenderGraph;

/**
 * GPU copy of a PlaneMesh
 */
struct ScreenMeshBuffers {
    BufferHandle vertices = nullptr;

    BufferHandle indices = nullptr;

    uint32_t num_indices = 0;
};

/**
 * Draws the virtual screen into both layers of a render target with one multiview pass
 */
class ScreenPhase {
public:
    /**
     * Builds a pipeline for every ScreenRenderStrategy variant
     */
    ScreenPhase();

    /**
     * Records the screen draw
     *
     * @param source Side-by-side or mono video frame. Must be in SHADER_READ_ONLY_OPTIMAL before the graph runs
     * @param target Two-layer color target, one layer per eye
     * @param clear_target Whether to clear the target to black first. False when something was already drawn into it
     * this frame, such as the flat background
     */
    void render(
        RenderGraph& graph, const FrameUniforms& uniforms, const ScreenRenderStrategy& strategy, TextureHandle source,
        TextureHandle target, const ScreenMeshBuffers& mesh, bool clear_target
    ) const;

private:
    std::array<GraphicsPipelineHandle, ScreenRenderStrategy::num_variants> pipelines = {};
};
