#pragma once

#include <string>

#include <volk.h>
#include <vk_mem_alloc.h>
#include <glm/vec2.hpp>

enum class TextureAllocationType {
    /**
     * Memory comes from our VMA instance, the allocator destroys the image
     */
    Vma,

    /**
     * Image and view belong to someone else, such as the video decoder. We only keep the handles
     */
    External,
};

struct GpuTexture {
    std::string name;

    VkImageCreateInfo create_info = {};

    VkImage image = VK_NULL_HANDLE;

    /**
     * View of every layer. A 2D array view when the image has more than one layer
     */
    VkImageView image_view = VK_NULL_HANDLE;

    /**
     * View to use when rendering to this image. Covers mip 0 and every layer
     */
    VkImageView attachment_view = VK_NULL_HANDLE;

    TextureAllocationType type = TextureAllocationType::Vma;

    VmaAllocation allocation = VK_NULL_HANDLE;

    VmaAllocationInfo allocation_info = {};

    glm::uvec2 get_resolution() const;

    uint32_t get_num_layers() const;
};

inline glm::uvec2 GpuTexture::get_resolution() const {
    return {create_info.extent.width, create_info.extent.height};
}

inline uint32_t GpuTexture::get_num_layers() const {
    return create_info.arrayLayers;
}
