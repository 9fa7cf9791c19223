#include "resource_access_tracker.hpp"

#include <algorithm>

#include <magic_enum.hpp>
#include <spdlog/fmt/fmt.h>
#include <vulkan/vk_enum_string_helper.h>

#include "core/system_interface.hpp"
#include "render/backend/command_buffer.hpp"
#include "render/backend/gpu_texture.hpp"
#include "render/backend/buffer.hpp"
#include "render/backend/utils.hpp"

static std::shared_ptr<spdlog::logger> logger;

static bool is_write_access(const VkAccessFlags2 access) {
    constexpr auto write_mask =
        VK_ACCESS_2_SHADER_WRITE_BIT |
        VK_ACCESS_2_COLOR_ATTACHMENT_WRITE_BIT |
        VK_ACCESS_2_DEPTH_STENCIL_ATTACHMENT_WRITE_BIT |
        VK_ACCESS_2_TRANSFER_WRITE_BIT |
        VK_ACCESS_2_HOST_WRITE_BIT |
        VK_ACCESS_2_MEMORY_WRITE_BIT |
        VK_ACCESS_2_SHADER_STORAGE_WRITE_BIT;
    return (access & write_mask) != 0;
}

static VkImageSubresourceRange whole_image(const TextureHandle texture) {
    return {
        .aspectMask = to_aspect_flags(texture->create_info.format),
        .baseMipLevel = 0,
        .levelCount = texture->create_info.mipLevels,
        .baseArrayLayer = 0,
        .layerCount = texture->create_info.arrayLayers,
    };
}

ResourceAccessTracker::ResourceAccessTracker() {
    if(logger == nullptr) {
        logger = SystemInterface::get().get_logger("ResourceAccessTracker");
    }
}

void ResourceAccessTracker::set_resource_usage(const TextureUsageToken& usage, const bool skip_barrier) {
    const auto texture = usage.texture;

    auto existing_usage = std::find_if(
        last_texture_usages.begin(),
        last_texture_usages.end(),
        [=](const TextureUsageToken& token) {
            return token.texture == texture;
        });

    if(existing_usage == last_texture_usages.end()) {
        if(!skip_barrier) {
            logger->trace(
                "Transitioning image {} from {} to {} because it's the first usage of the image",
                texture->name,
                string_VkImageLayout(VK_IMAGE_LAYOUT_UNDEFINED),
                string_VkImageLayout(usage.layout));
            image_barriers.emplace_back(
                VkImageMemoryBarrier2{
                    .sType = VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER_2,
                    .srcStageMask = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT,
                    .srcAccessMask = VK_ACCESS_2_MEMORY_READ_BIT,
                    .dstStageMask = usage.stage,
                    .dstAccessMask = usage.access,
                    .oldLayout = VK_IMAGE_LAYOUT_UNDEFINED,
                    .newLayout = usage.layout,
                    .image = texture->image,
                    .subresourceRange = whole_image(texture),
                });
        }

        last_texture_usages.emplace_back(usage);
        return;
    }

    if(!skip_barrier) {
        // Issue a barrier if either access writes, the layout changes, or a later stage needs the data
        const auto needs_write_barrier = is_write_access(usage.access) || is_write_access(existing_usage->access);
        const auto needs_transition_barrier = usage.layout != existing_usage->layout;
        const auto needs_stage_barrier = usage.stage != existing_usage->stage;
        if(needs_write_barrier || needs_transition_barrier || needs_stage_barrier) {
            if(needs_transition_barrier) {
                logger->trace(
                    "Transitioning image {} from {} to {}",
                    texture->name,
                    magic_enum::enum_name(existing_usage->layout),
                    magic_enum::enum_name(usage.layout));
            }
            image_barriers.emplace_back(
                VkImageMemoryBarrier2{
                    .sType = VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER_2,
                    .srcStageMask = existing_usage->stage,
                    .srcAccessMask = existing_usage->access,
                    .dstStageMask = usage.stage,
                    .dstAccessMask = usage.access,
                    .oldLayout = existing_usage->layout,
                    .newLayout = usage.layout,
                    .image = texture->image,
                    .subresourceRange = whole_image(texture),
                });
        }
    }

    *existing_usage = usage;
}

void ResourceAccessTracker::set_resource_usage(const BufferUsageToken& usage) {
    auto itr = std::find_if(
        last_buffer_usages.begin(),
        last_buffer_usages.end(),
        [=](const BufferUsageToken& last_usage) {
            return last_usage.buffer == usage.buffer;
        });
    if(itr == last_buffer_usages.end()) {
        last_buffer_usages.emplace_back(usage);
        return;
    }

    if(is_write_access(usage.access) || is_write_access(itr->access)) {
        buffer_barriers.emplace_back(
            VkBufferMemoryBarrier2{
                .sType = VK_STRUCTURE_TYPE_BUFFER_MEMORY_BARRIER_2,
                .srcStageMask = itr->stage,
                .srcAccessMask = itr->access,
                .dstStageMask = usage.stage,
                .dstAccessMask = usage.access,
                .buffer = usage.buffer->buffer,
                .size = VK_WHOLE_SIZE,
            });
    }

    *itr = usage;
}

void ResourceAccessTracker::issue_barriers(const CommandBuffer& commands) {
    if(buffer_barriers.empty() && image_barriers.empty()) {
        return;
    }

    static const auto memory_barriers = eastl::fixed_vector<VkMemoryBarrier2, 32>{};
    commands.barrier(memory_barriers, buffer_barriers, image_barriers);
    buffer_barriers.clear();
    image_barriers.clear();
}

void ResourceAccessTracker::forget(const TextureHandle texture_handle) {
    last_texture_usages.erase(
        std::remove_if(
            last_texture_usages.begin(),
            last_texture_usages.end(),
            [=](const TextureUsageToken& token) {
                return token.texture == texture_handle;
            }),
        last_texture_usages.end());
}

void ResourceAccessTracker::forget(const BufferHandle buffer_handle) {
    last_buffer_usages.erase(
        std::remove_if(
            last_buffer_usages.begin(),
            last_buffer_usages.end(),
            [=](const BufferUsageToken& token) {
                return token.buffer == buffer_handle;
            }),
        last_buffer_usages.end());
}
