#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <volk.h>
#include <EASTL/fixed_vector.h>
#include <tl/optional.hpp>

#include "render/backend/descriptor_set.hpp"
#include "render/backend/handles.hpp"

class PipelineCache;

/**
 * Reflects the descriptor sets out of a SPIR-V module
 *
 * Sets used by more than one stage are merged, their stage flags OR'd together. Shaders get all their parameters from
 * uniform buffers, so a push constant block is an error
 *
 * @return True if there was an error, false if everything's fine
 */
bool collect_bindings(
    const std::vector<uint8_t>& shader_instructions,
    std::string_view shader_name,
    VkShaderStageFlagBits shader_stage,
    eastl::fixed_vector<DescriptorSetInfo, 4>& descriptor_sets
);

/**
 * Which vertex buffer layout the vertex shader reads
 */
enum class VertexLayout {
    /**
     * No vertex buffers. The shader generates its own positions, like a fullscreen triangle
     */
    None,

    /**
     * One interleaved buffer of ScreenVertex: position at location 0, texcoord at location 1
     */
    ScreenVertex,
};

/**
 * Depth/stencil state with sane defaults
 *
 * The screen passes have no depth buffer, so depth test and depth write default to off. Eye projections put the near
 * plane at depth 0, so the compare op defaults to less
 */
struct DepthStencilState {
    bool enable_depth_test = false;

    bool enable_depth_write = false;

    VkCompareOp compare_op = VK_COMPARE_OP_LESS;
};

struct RasterState {
    VkPolygonMode polygon_mode = VK_POLYGON_MODE_FILL;

    /**
     * The curved screen is viewed from inside the curve, so we don't cull by default
     */
    VkCullModeFlags cull_mode = VK_CULL_MODE_NONE;

    VkFrontFace front_face = VK_FRONT_FACE_COUNTER_CLOCKWISE;

    float line_width = 1.f;
};

class GraphicsPipelineBuilder {
    friend class PipelineCache;

public:
    explicit GraphicsPipelineBuilder(PipelineCache& cache_in);

    GraphicsPipelineBuilder& set_name(std::string_view name_in);

    GraphicsPipelineBuilder& set_vertex_layout(VertexLayout layout);

    GraphicsPipelineBuilder& set_topology(VkPrimitiveTopology topology_in);

    /**
     * Loads the vertex shader from storage and reflects its descriptor sets and push constants
     *
     * The vertex shader must already be compiled to SPIR-V. Calling this method more than once is an error
     */
    GraphicsPipelineBuilder& set_vertex_shader(const std::filesystem::path& vertex_path);

    GraphicsPipelineBuilder& set_fragment_shader(const std::filesystem::path& fragment_path);

    GraphicsPipelineBuilder& set_depth_state(const DepthStencilState& depth_stencil);

    GraphicsPipelineBuilder& set_raster_state(const RasterState& raster_state_in);

    GraphicsPipelineBuilder& set_blend_state(
        uint32_t color_target_index, const VkPipelineColorBlendAttachmentState& blend
    );

    GraphicsPipelineHandle build();

private:
    PipelineCache& cache;

    std::string name;

    tl::optional<std::vector<uint8_t>> vertex_shader;

    std::string vertex_shader_name;

    tl::optional<std::vector<uint8_t>> fragment_shader;

    std::string fragment_shader_name;

    eastl::fixed_vector<DescriptorSetInfo, 4> descriptor_sets;

    VkPipelineDepthStencilStateCreateInfo depth_stencil_state = {};

    VkPipelineRasterizationStateCreateInfo raster_state = {};

    eastl::fixed_vector<VkPipelineColorBlendAttachmentState, 4> blends = {};

    VkPrimitiveTopology topology = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;

    VertexLayout vertex_layout = VertexLayout::None;
};
