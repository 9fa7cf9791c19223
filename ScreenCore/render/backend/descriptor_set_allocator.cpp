#include "descriptor_set_allocator.hpp"

#include <spdlog/fmt/fmt.h>
#include <vulkan/vk_enum_string_helper.h>

#include "render/backend/graphics_pipeline.hpp"
#include "render/backend/render_backend.hpp"

/**
 * Number of sets each pool holds. The screen renderer builds a handful of sets per frame, so one pool is normally
 * enough
 */
constexpr static uint32_t sets_per_pool = 256;

DescriptorSetAllocator::DescriptorSetAllocator(RenderBackend& backend_in) : backend{&backend_in} {}

DescriptorSetAllocator::DescriptorSetAllocator(DescriptorSetAllocator&& old) noexcept :
    backend{old.backend}, current_pool{old.current_pool}, descriptor_sizes{std::move(old.descriptor_sizes)},
    used_pools{std::move(old.used_pools)}, free_pools{std::move(old.free_pools)} {
    old.current_pool = VK_NULL_HANDLE;
    old.used_pools.clear();
    old.free_pools.clear();
}

DescriptorSetAllocator::~DescriptorSetAllocator() {
    const auto device = backend->get_device();
    if(device == VK_NULL_HANDLE) {
        return;
    }

    for(const auto pool : free_pools) {
        vkDestroyDescriptorPool(device, pool, nullptr);
    }
    for(const auto pool : used_pools) {
        vkDestroyDescriptorPool(device, pool, nullptr);
    }
}

DescriptorSetBuilder DescriptorSetAllocator::build_set(const GraphicsPipelineHandle pipeline, const uint32_t set_index) {
    if(set_index >= pipeline->descriptor_sets.size()) {
        throw std::runtime_error{
            fmt::format("Pipeline {} has no descriptor set {}", pipeline->name, set_index)
        };
    }

    const auto name = fmt::format("{} set {}", pipeline->name, set_index);
    return DescriptorSetBuilder{
        *backend, *this, pipeline->descriptor_set_layouts[set_index], pipeline->descriptor_sets[set_index], name
    };
}

VkDescriptorSet DescriptorSetAllocator::allocate(const VkDescriptorSetLayout layout) {
    if(current_pool == VK_NULL_HANDLE) {
        current_pool = grab_pool();
        used_pools.push_back(current_pool);
    }

    auto alloc_info = VkDescriptorSetAllocateInfo{
        .sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO,
        .descriptorPool = current_pool,
        .descriptorSetCount = 1,
        .pSetLayouts = &layout,
    };

    auto set = VkDescriptorSet{};
    auto result = vkAllocateDescriptorSets(backend->get_device(), &alloc_info, &set);
    if(result == VK_ERROR_FRAGMENTED_POOL || result == VK_ERROR_OUT_OF_POOL_MEMORY) {
        // The current pool is full, grab a new one and retry
        current_pool = grab_pool();
        used_pools.push_back(current_pool);

        alloc_info.descriptorPool = current_pool;
        result = vkAllocateDescriptorSets(backend->get_device(), &alloc_info, &set);
    }

    if(result != VK_SUCCESS) {
        throw std::runtime_error{fmt::format("Could not allocate descriptor set: {}", string_VkResult(result))};
    }

    return set;
}

void DescriptorSetAllocator::reset_pools() {
    for(const auto pool : used_pools) {
        vkResetDescriptorPool(backend->get_device(), pool, 0);
    }

    free_pools.insert(free_pools.end(), used_pools.begin(), used_pools.end());
    used_pools.clear();
    current_pool = VK_NULL_HANDLE;
}

VkDescriptorPool DescriptorSetAllocator::grab_pool() {
    if(!free_pools.empty()) {
        const auto pool = free_pools.back();
        free_pools.pop_back();
        return pool;
    }

    auto sizes = eastl::vector<VkDescriptorPoolSize>{};
    sizes.reserve(descriptor_sizes.sizes.size());
    for(const auto& [type, ratio] : descriptor_sizes.sizes) {
        sizes.push_back({type, static_cast<uint32_t>(ratio * sets_per_pool)});
    }

    const auto create_info = VkDescriptorPoolCreateInfo{
        .sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO,
        .maxSets = sets_per_pool,
        .poolSizeCount = static_cast<uint32_t>(sizes.size()),
        .pPoolSizes = sizes.data(),
    };

    auto pool = VkDescriptorPool{};
    const auto result = vkCreateDescriptorPool(backend->get_device(), &create_info, nullptr, &pool);
    if(result != VK_SUCCESS) {
        throw std::runtime_error{fmt::format("Could not create descriptor pool: {}", string_VkResult(result))};
    }

    return pool;
}
