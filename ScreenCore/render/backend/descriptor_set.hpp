#pragma once

#include <string>
#include <string_view>

#include <volk.h>
#include <EASTL/fixed_vector.h>

#include "render/backend/handles.hpp"
#include "render/backend/usage_token.hpp"

class DescriptorSetAllocator;
class RenderBackend;

struct DescriptorInfo : VkDescriptorSetLayoutBinding {
    bool is_read_only = false;
};

/**
 * Reflected layout of one descriptor set. Bindings are indexed by binding number
 */
struct DescriptorSetInfo {
    eastl::fixed_vector<DescriptorInfo, 16> bindings;
};

namespace detail {
    struct CombinedImageSampler {
        TextureHandle texture;

        VkSampler sampler;
    };

    struct BoundResource {
        union {
            BufferHandle buffer;
            CombinedImageSampler combined_image_sampler = {};
        };
    };
}

struct DescriptorSet {
    VkDescriptorSet descriptor_set = VK_NULL_HANDLE;

    DescriptorSetInfo set_info;

    eastl::fixed_vector<detail::BoundResource, 16> bindings;

    /**
     * Appends the accesses this set makes to the usage lists, merging with tokens already present for the same resource
     */
    void get_resource_usage_information(TextureUsageList& texture_usages, BufferUsageList& buffer_usages) const;
};

/**
 * Fills a descriptor set in binding order
 *
 * Only uniform buffers and combined image samplers are supported. That's all the screen shaders use
 */
class DescriptorSetBuilder {
public:
    DescriptorSetBuilder(
        RenderBackend& backend_in, DescriptorSetAllocator& allocator_in, VkDescriptorSetLayout layout_in,
        DescriptorSetInfo set_info_in, std::string_view name_in
    );

    DescriptorSetBuilder& bind(BufferHandle buffer);

    DescriptorSetBuilder& bind(TextureHandle texture, VkSampler vk_sampler);

    DescriptorSet build();

private:
    RenderBackend* backend;

    DescriptorSetAllocator* allocator;

    VkDescriptorSetLayout layout;

    DescriptorSetInfo set_info;

    uint32_t binding_index = 0;

    eastl::fixed_vector<detail::BoundResource, 16> bindings;

    std::string name;

    void check_binding(VkDescriptorType expected_type) const;
};
