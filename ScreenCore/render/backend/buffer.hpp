#pragma once

#include <string>

#include <volk.h>
#include <vk_mem_alloc.h>

struct GpuBuffer {
    std::string name;

    VkBufferCreateInfo create_info = {};

    VkBuffer buffer = VK_NULL_HANDLE;

    VmaAllocation allocation = VK_NULL_HANDLE;

    /**
     * pMappedData is non-null for buffers the CPU writes to, such as uniform buffers
     */
    VmaAllocationInfo allocation_info = {};
};
