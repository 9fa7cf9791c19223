#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <volk.h>
#include <EASTL/fixed_vector.h>
#include <tl/optional.hpp>

#include "render/backend/descriptor_set.hpp"

/**
 * A PSO compiled for one set of attachment formats and view mask
 */
struct PipelineVariant {
    eastl::fixed_vector<VkFormat, 4> color_formats;

    tl::optional<VkFormat> depth_format;

    uint32_t view_mask = 0;

    VkPipeline pipeline = VK_NULL_HANDLE;
};

/**
 * Graphics pipeline description plus the PSOs compiled from it
 *
 * The layout and descriptor set layouts are created when the pipeline is built. PSOs are compiled lazily, the first
 * time the pipeline is bound inside a render pass with a new set of attachment formats. The PipelineCache owns every
 * Vulkan object in here and destroys them when it's destroyed
 */
struct GraphicsPipeline {
    std::string name;

    VkPipelineLayout layout = VK_NULL_HANDLE;

    eastl::fixed_vector<DescriptorSetInfo, 4> descriptor_sets;

    eastl::fixed_vector<VkDescriptorSetLayout, 4> descriptor_set_layouts;

    std::vector<uint8_t> vertex_shader;

    std::vector<uint8_t> fragment_shader;

    VkPrimitiveTopology topology = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;

    eastl::fixed_vector<VkVertexInputBindingDescription, 2> vertex_inputs;

    eastl::fixed_vector<VkVertexInputAttributeDescription, 4> vertex_attributes;

    VkPipelineDepthStencilStateCreateInfo depth_stencil_state = {};

    VkPipelineRasterizationStateCreateInfo raster_state = {};

    eastl::fixed_vector<VkPipelineColorBlendAttachmentState, 4> blends = {};

    mutable eastl::fixed_vector<PipelineVariant, 4> variants;
};
