#pragma once

#include <span>

#include <volk.h>
#include <plf_colony.h>
#include <tl/optional.hpp>

#include "render/backend/graphics_pipeline.hpp"
#include "render/backend/pipeline_builder.hpp"

class RenderBackend;

class PipelineCache {
public:
    explicit PipelineCache(RenderBackend& backend_in);

    ~PipelineCache();

    GraphicsPipelineHandle create_pipeline(const GraphicsPipelineBuilder& pipeline_builder);

    /**
     * Returns the PSO for the pipeline with the given attachment formats and view mask, compiling it if needed
     */
    VkPipeline get_pipeline_for_dynamic_rendering(
        GraphicsPipelineHandle pipeline,
        std::span<const VkFormat> color_attachment_formats,
        tl::optional<VkFormat> depth_format = tl::nullopt,
        uint32_t view_mask = 0
    ) const;

private:
    RenderBackend& backend;

    VkPipelineCache vk_pipeline_cache = VK_NULL_HANDLE;

    plf::colony<GraphicsPipeline> pipelines;

    void create_pipeline_layout(GraphicsPipeline& pipeline) const;
};
