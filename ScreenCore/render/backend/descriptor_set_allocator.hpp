#pragma once

#include <string_view>
#include <utility>

#include <volk.h>
#include <EASTL/vector.h>

#include "render/backend/descriptor_set.hpp"
#include "render/backend/handles.hpp"

class RenderBackend;

/**
 * Hands out descriptor sets from a growing list of pools
 *
 * The backend keeps one of these per frame in flight and resets it when the frame's fence is signalled, so sets from
 * this allocator are only valid for the frame they were built in
 */
class DescriptorSetAllocator {
public:
    struct PoolSizes {
        eastl::vector<std::pair<VkDescriptorType, float>> sizes =
        {
            {VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER, 4.f},
            {VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER, 2.f},
        };
    };

    explicit DescriptorSetAllocator(RenderBackend& backend_in);

    DescriptorSetAllocator(const DescriptorSetAllocator& other) = delete;

    DescriptorSetAllocator& operator=(const DescriptorSetAllocator& other) = delete;

    DescriptorSetAllocator(DescriptorSetAllocator&& old) noexcept;

    DescriptorSetAllocator& operator=(DescriptorSetAllocator&& old) noexcept = delete;

    ~DescriptorSetAllocator();

    DescriptorSetBuilder build_set(GraphicsPipelineHandle pipeline, uint32_t set_index);

    VkDescriptorSet allocate(VkDescriptorSetLayout layout);

    void reset_pools();

private:
    RenderBackend* backend;

    VkDescriptorPool current_pool = VK_NULL_HANDLE;

    PoolSizes descriptor_sizes;

    eastl::vector<VkDescriptorPool> used_pools;

    eastl::vector<VkDescriptorPool> free_pools;

    VkDescriptorPool grab_pool();
};
