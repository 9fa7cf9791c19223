#include "command_buffer.hpp"

#include <cstring>

#include <spdlog/fmt/fmt.h>
#include <vulkan/vk_enum_string_helper.h>

#include "render/backend/render_backend.hpp"
#include "render/backend/pipeline_cache.hpp"
#include "render/backend/descriptor_set.hpp"
#include "render/backend/gpu_texture.hpp"
#include "render/backend/buffer.hpp"
#include "core/system_interface.hpp"

static std::shared_ptr<spdlog::logger> logger;

CommandBuffer::CommandBuffer(const VkCommandBuffer vk_cmds, RenderBackend& backend_in) :
    commands{vk_cmds}, backend{&backend_in} {
    if(logger == nullptr) {
        logger = SystemInterface::get().get_logger("CommandBuffer");
    }
    for(auto& set : descriptor_sets) {
        set = VK_NULL_HANDLE;
    }
}

void CommandBuffer::begin() const {
    constexpr auto begin_info = VkCommandBufferBeginInfo{
        .sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO,
        .flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT,
    };
    const auto result = vkBeginCommandBuffer(commands, &begin_info);
    if(result != VK_SUCCESS) {
        throw std::runtime_error{fmt::format("Could not begin command buffer: {}", string_VkResult(result))};
    }
}

void CommandBuffer::update_buffer_immediate(
    const BufferHandle buffer, const void* data, const uint32_t data_size, const uint32_t offset
) const {
    if(buffer->allocation_info.pMappedData == nullptr) {
        throw std::runtime_error{fmt::format("Buffer {} is not host-visible", buffer->name)};
    }
    if(offset + data_size > buffer->create_info.size) {
        throw std::runtime_error{
            fmt::format(
                "Write of {} bytes at offset {} overflows buffer {} of size {}",
                data_size,
                offset,
                buffer->name,
                buffer->create_info.size)
        };
    }

    auto* write_ptr = static_cast<uint8_t*>(buffer->allocation_info.pMappedData) + offset;
    std::memcpy(write_ptr, data, data_size);

    flush_buffer(buffer);
}

void CommandBuffer::flush_buffer(const BufferHandle buffer) const {
    const auto& allocator = backend->get_global_allocator();

    const auto result = vmaFlushAllocation(allocator.get_vma(), buffer->allocation, 0, VK_WHOLE_SIZE);
    if(result != VK_SUCCESS) {
        throw std::runtime_error{
            fmt::format("Could not flush buffer {}: {}", buffer->name, string_VkResult(result))
        };
    }
}

void CommandBuffer::barrier(
    const eastl::fixed_vector<VkMemoryBarrier2, 32>& memory_barriers,
    const eastl::fixed_vector<VkBufferMemoryBarrier2, 32>& buffer_barriers,
    const eastl::fixed_vector<VkImageMemoryBarrier2, 32>& image_barriers
) const {
    const auto dependency_info = VkDependencyInfo{
        .sType = VK_STRUCTURE_TYPE_DEPENDENCY_INFO,
        .memoryBarrierCount = static_cast<uint32_t>(memory_barriers.size()),
        .pMemoryBarriers = memory_barriers.data(),
        .bufferMemoryBarrierCount = static_cast<uint32_t>(buffer_barriers.size()),
        .pBufferMemoryBarriers = buffer_barriers.data(),
        .imageMemoryBarrierCount = static_cast<uint32_t>(image_barriers.size()),
        .pImageMemoryBarriers = image_barriers.data()
    };
    vkCmdPipelineBarrier2(commands, &dependency_info);
}

void CommandBuffer::begin_rendering(const RenderingInfo& info) {
    auto color_infos = eastl::fixed_vector<VkRenderingAttachmentInfo, 4>{};

    bound_color_attachment_formats.clear();

    for(const auto& color_attachment : info.color_attachments) {
        color_infos.emplace_back(
            VkRenderingAttachmentInfo{
                .sType = VK_STRUCTURE_TYPE_RENDERING_ATTACHMENT_INFO,
                .imageView = color_attachment.image->attachment_view,
                .imageLayout = VK_IMAGE_LAYOUT_ATTACHMENT_OPTIMAL,
                .loadOp = color_attachment.load_op,
                .storeOp = color_attachment.store_op,
                .clearValue = color_attachment.clear_value,
            });

        bound_color_attachment_formats.emplace_back(color_attachment.image->create_info.format);
    }

    auto depth_info = VkRenderingAttachmentInfo{};
    if(info.depth_attachment) {
        depth_info = VkRenderingAttachmentInfo{
            .sType = VK_STRUCTURE_TYPE_RENDERING_ATTACHMENT_INFO,
            .imageView = info.depth_attachment->image->attachment_view,
            .imageLayout = VK_IMAGE_LAYOUT_ATTACHMENT_OPTIMAL,
            .loadOp = info.depth_attachment->load_op,
            .storeOp = info.depth_attachment->store_op,
            .clearValue = info.depth_attachment->clear_value,
        };
        bound_depth_attachment_format = info.depth_attachment->image->create_info.format;
    }

    const auto rendering_info = VkRenderingInfo{
        .sType = VK_STRUCTURE_TYPE_RENDERING_INFO,
        .renderArea = {
            .offset = {.x = info.render_area_begin.x, .y = info.render_area_begin.y},
            .extent = {.width = info.render_area_size.x, .height = info.render_area_size.y}
        },
        // layerCount is ignored when multiview is on
        .layerCount = info.view_mask == 0 ? info.layer_count : 0,
        .viewMask = info.view_mask,
        .colorAttachmentCount = static_cast<uint32_t>(color_infos.size()),
        .pColorAttachments = color_infos.data(),
        .pDepthAttachment = info.depth_attachment ? &depth_info : nullptr,
    };

    bound_view_mask = info.view_mask;
    is_rendering = true;

    vkCmdBeginRendering(commands, &rendering_info);

    const auto viewport = VkViewport{
        .x = static_cast<float>(info.render_area_begin.x),
        .y = static_cast<float>(info.render_area_begin.y),
        .width = static_cast<float>(info.render_area_size.x),
        .height = static_cast<float>(info.render_area_size.y),
        .minDepth = 0,
        .maxDepth = 1
    };
    vkCmdSetViewport(commands, 0, 1, &viewport);

    vkCmdSetScissor(commands, 0, 1, &rendering_info.renderArea);
}

void CommandBuffer::end_rendering() {
    vkCmdEndRendering(commands);

    bound_color_attachment_formats.clear();
    bound_depth_attachment_format = tl::nullopt;
    bound_view_mask = 0;
    is_rendering = false;
}

void CommandBuffer::bind_vertex_buffer(const uint32_t binding_index, const BufferHandle buffer) const {
    constexpr auto offset = VkDeviceSize{0};

    vkCmdBindVertexBuffers(commands, binding_index, 1, &buffer->buffer, &offset);
}

void CommandBuffer::draw_indexed(
    const uint32_t num_indices, const uint32_t num_instances, const uint32_t first_index, const uint32_t first_vertex,
    const uint32_t first_instance
) {
    commit_bindings();

    vkCmdDrawIndexed(
        commands,
        num_indices,
        num_instances,
        first_index,
        static_cast<int32_t>(first_vertex),
        first_instance);
}

void CommandBuffer::draw_triangle() {
    commit_bindings();

    vkCmdDraw(commands, 3, 1, 0, 0);
}

void CommandBuffer::bind_pipeline(const GraphicsPipelineHandle pipeline) {
    if(!is_rendering) {
        throw std::runtime_error{fmt::format("Pipeline {} bound outside of a render pass", pipeline->name)};
    }

    current_pipeline_layout = pipeline->layout;
    num_descriptor_sets_in_current_pipeline = static_cast<uint32_t>(pipeline->descriptor_sets.size());

    const auto& cache = backend->get_pipeline_cache();
    const auto vk_pipeline = cache.get_pipeline_for_dynamic_rendering(
        pipeline,
        {bound_color_attachment_formats.data(), bound_color_attachment_formats.size()},
        bound_depth_attachment_format,
        bound_view_mask);

    vkCmdBindPipeline(commands, VK_PIPELINE_BIND_POINT_GRAPHICS, vk_pipeline);

    are_bindings_dirty = true;
}

void CommandBuffer::bind_descriptor_set(const uint32_t set_index, const DescriptorSet& set) {
    bind_descriptor_set(set_index, set.descriptor_set);
}

void CommandBuffer::bind_descriptor_set(const uint32_t set_index, const VkDescriptorSet set) {
    descriptor_sets.at(set_index) = set;

    are_bindings_dirty = true;
}

void CommandBuffer::clear_descriptor_set(const uint32_t set_index) {
    descriptor_sets.at(set_index) = VK_NULL_HANDLE;

    are_bindings_dirty = true;
}

void CommandBuffer::clear_color_image(const TextureHandle image, const glm::vec4& color) const {
    const auto clear_value = VkClearColorValue{.float32 = {color.r, color.g, color.b, color.a}};
    const auto range = VkImageSubresourceRange{
        .aspectMask = VK_IMAGE_ASPECT_COLOR_BIT,
        .baseMipLevel = 0,
        .levelCount = VK_REMAINING_MIP_LEVELS,
        .baseArrayLayer = 0,
        .layerCount = VK_REMAINING_ARRAY_LAYERS,
    };
    vkCmdClearColorImage(commands, image->image, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, &clear_value, 1, &range);
}

void CommandBuffer::begin_label(const std::string& event_name) const {
    logger->trace("[{}]: begin_label", event_name);
    if(vkCmdBeginDebugUtilsLabelEXT == nullptr) {
        return;
    }

    const auto label = VkDebugUtilsLabelEXT{
        .sType = VK_STRUCTURE_TYPE_DEBUG_UTILS_LABEL_EXT,
        .pLabelName = event_name.c_str()
    };

    vkCmdBeginDebugUtilsLabelEXT(commands, &label);
}

void CommandBuffer::end_label() const {
    logger->trace("end_label");
    if(vkCmdEndDebugUtilsLabelEXT == nullptr) {
        return;
    }

    vkCmdEndDebugUtilsLabelEXT(commands);
}

void CommandBuffer::end() const {
    const auto result = vkEndCommandBuffer(commands);
    if(result != VK_SUCCESS) {
        throw std::runtime_error{fmt::format("Could not end command buffer: {}", string_VkResult(result))};
    }
}

void CommandBuffer::bind_index_buffer(const BufferHandle buffer, const VkIndexType index_type) const {
    vkCmdBindIndexBuffer(commands, buffer->buffer, 0, index_type);
}

void CommandBuffer::commit_bindings() {
    if(!are_bindings_dirty) {
        return;
    }

    for(uint32_t i = 0; i < num_descriptor_sets_in_current_pipeline && i < descriptor_sets.size(); i++) {
        if(descriptor_sets[i] != VK_NULL_HANDLE) {
            vkCmdBindDescriptorSets(
                commands,
                VK_PIPELINE_BIND_POINT_GRAPHICS,
                current_pipeline_layout,
                i,
                1,
                &descriptor_sets[i],
                0,
                nullptr);
        }
    }

    are_bindings_dirty = false;
}

VkCommandBuffer CommandBuffer::get_vk_commands() const {
    return commands;
}

RenderBackend& CommandBuffer::get_backend() const {
    return *backend;
}

#if defined(TRACY_ENABLE)
tracy::VkCtx* CommandBuffer::get_tracy_context() const {
    return backend->get_tracy_context();
}
#endif
