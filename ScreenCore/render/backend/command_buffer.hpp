#pragma once

#include <cstdint>
#include <string>

#include <volk.h>
#include <EASTL/array.h>
#include <EASTL/fixed_vector.h>
#include <glm/vec2.hpp>
#include <glm/vec4.hpp>
#include <tl/optional.hpp>
#include <tracy/Tracy.hpp>
#include <tracy/TracyVulkan.hpp>

#include "render/backend/handles.hpp"

struct DescriptorSet;
class RenderBackend;

struct RenderingAttachmentInfo {
    TextureHandle image;

    VkAttachmentLoadOp load_op = VK_ATTACHMENT_LOAD_OP_LOAD;
    VkAttachmentStoreOp store_op = VK_ATTACHMENT_STORE_OP_STORE;
    VkClearValue clear_value = {};
};

struct RenderingInfo {
    glm::ivec2 render_area_begin;

    glm::uvec2 render_area_size;

    uint32_t layer_count = 1;

    /**
     * Multiview mask. Zero disables multiview, in which case layer_count layers are bound
     */
    uint32_t view_mask = 0;

    eastl::fixed_vector<RenderingAttachmentInfo, 4> color_attachments;

    tl::optional<RenderingAttachmentInfo> depth_attachment;
};

/**
 * Command buffer abstraction
 *
 * Lets you work with handles and not worry about too much
 */
class CommandBuffer {
public:
    explicit CommandBuffer(VkCommandBuffer vk_cmds, RenderBackend& backend_in);

    void begin() const;

    /**
     * Writes some data to a host-visible buffer
     *
     * This method makes no attempt to solve for GPU/CPU resource access. You're expected to write to a buffer that's
     * not in use by any frame in flight
     *
     * @param offset Offset in bytes
     */
    template <typename DataType>
    void update_buffer_immediate(BufferHandle buffer, const DataType& data, uint32_t offset = 0);

    void update_buffer_immediate(BufferHandle buffer, const void* data, uint32_t data_size, uint32_t offset = 0) const;

    void flush_buffer(BufferHandle buffer) const;

    /**
     * Issues a batch of pipeline barriers
     */
    void barrier(
        const eastl::fixed_vector<VkMemoryBarrier2, 32>& memory_barriers,
        const eastl::fixed_vector<VkBufferMemoryBarrier2, 32>& buffer_barriers,
        const eastl::fixed_vector<VkImageMemoryBarrier2, 32>& image_barriers
    ) const;

    /**
     * Begins rendering with dynamic rendering
     */
    void begin_rendering(const RenderingInfo& info);

    void end_rendering();

    void bind_vertex_buffer(uint32_t binding_index, BufferHandle buffer) const;

    template <typename IndexType = uint32_t>
    void bind_index_buffer(BufferHandle buffer) const;

    void draw_indexed(
        uint32_t num_indices, uint32_t num_instances, uint32_t first_index, uint32_t first_vertex,
        uint32_t first_instance
    );

    /**
     * Draws a single triangle
     *
     * Intended for use with a pipeline that renders a fullscreen triangle, such as a postprocessing shader
     */
    void draw_triangle();

    /**
     * Binds a pipeline, compiling a PSO for the current attachments if needed. Must be called inside begin_rendering
     */
    void bind_pipeline(GraphicsPipelineHandle pipeline);

    void bind_descriptor_set(uint32_t set_index, const DescriptorSet& set);

    void bind_descriptor_set(uint32_t set_index, VkDescriptorSet set);

    void clear_descriptor_set(uint32_t set_index);

    /**
     * Clears every layer of an image that's in TRANSFER_DST_OPTIMAL
     */
    void clear_color_image(TextureHandle image, const glm::vec4& color) const;

    void begin_label(const std::string& event_name) const;

    void end_label() const;

    void end() const;

#if defined(TRACY_ENABLE)
    tracy::VkCtx* get_tracy_context() const;
#endif

    VkCommandBuffer get_vk_commands() const;

    RenderBackend& get_backend() const;

private:
    VkCommandBuffer commands;

    RenderBackend* backend;

    uint32_t bound_view_mask = 0;

    eastl::fixed_vector<VkFormat, 4> bound_color_attachment_formats;

    tl::optional<VkFormat> bound_depth_attachment_format;

    bool is_rendering = false;

    eastl::array<VkDescriptorSet, 4> descriptor_sets = {};

    VkPipelineLayout current_pipeline_layout = VK_NULL_HANDLE;

    uint32_t num_descriptor_sets_in_current_pipeline = 0;

    bool are_bindings_dirty = false;

    void bind_index_buffer(BufferHandle buffer, VkIndexType index_type) const;

    void commit_bindings();
};

template <typename DataType>
void CommandBuffer::update_buffer_immediate(const BufferHandle buffer, const DataType& data, const uint32_t offset) {
    update_buffer_immediate(buffer, &data, sizeof(DataType), offset);
}

template <typename IndexType>
void CommandBuffer::bind_index_buffer(const BufferHandle buffer) const {
    static_assert(
        sizeof(IndexType) == sizeof(uint32_t) || sizeof(IndexType) == sizeof(uint16_t),
        "Index type must be 16 or 32 bits");

    if constexpr(sizeof(IndexType) == sizeof(uint32_t)) {
        bind_index_buffer(buffer, VK_INDEX_TYPE_UINT32);
    } else {
        bind_index_buffer(buffer, VK_INDEX_TYPE_UINT16);
    }
}

#if defined(TRACY_ENABLE)
#define GpuZoneScopedN(commands, name) ZoneScopedN(name); TracyVkZone((commands).get_tracy_context(), (commands).get_vk_commands(), name)
#else
#define GpuZoneScopedN(commands, name) ZoneScopedN(name)
#endif

#define GpuZoneScoped(commands) GpuZoneScopedN(commands, __func__)
