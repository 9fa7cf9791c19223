#pragma once

#include <functional>
#include <string>
#include <vector>

#include <glm/vec4.hpp>
#include <tl/optional.hpp>

#include "render/backend/command_buffer.hpp"
#include "render/backend/descriptor_set.hpp"
#include "render/backend/handles.hpp"
#include "render/backend/usage_token.hpp"

/**
 * Pass that runs arbitrary commands outside of a render pass
 */
struct ComputePass {
    std::string name;

    TextureUsageList textures;

    BufferUsageList buffers;

    std::vector<DescriptorSet> descriptor_sets;

    std::function<void(CommandBuffer&)> execute;
};

/**
 * Pass that clears every layer of a color texture outside of a render pass
 */
struct ClearPass {
    std::string name;

    TextureHandle image;

    glm::vec4 clear_color = glm::vec4{0};
};

struct DynamicRenderingPass {
    std::string name;

    /**
     * Textures this pass reads that aren't in one of its descriptor sets
     */
    TextureUsageList textures;

    BufferUsageList buffers;

    /**
     * Descriptor sets the pass binds. The render graph reads their resource usage to issue barriers
     */
    std::vector<DescriptorSet> descriptor_sets;

    eastl::fixed_vector<RenderingAttachmentInfo, 4> color_attachments;

    tl::optional<RenderingAttachmentInfo> depth_attachment;

    /**
     * Multiview mask. When set, each bit renders one layer of every attachment in a single pass
     */
    tl::optional<uint32_t> view_mask;

    /**
     * Executes this render pass
     *
     * The attachments are bound before this function is called. The viewport and scissor are set to the dimensions of
     * the render targets, no need to do that manually
     */
    std::function<void(CommandBuffer&)> execute;
};
