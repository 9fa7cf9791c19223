#include "resource_allocator.hpp"

#include <functional>
#include <vector>

#include <spdlog/fmt/fmt.h>
#include <magic_enum.hpp>
#include <tracy/Tracy.hpp>
#include <vulkan/vk_enum_string_helper.h>

#include "render/backend/render_backend.hpp"
#include "render/backend/resource_access_tracker.hpp"
#include "render/backend/utils.hpp"
#include "core/system_interface.hpp"

static std::shared_ptr<spdlog::logger> logger;

template <typename ValueType>
static void hash_combine(std::size_t& seed, const ValueType& value) {
    seed ^= std::hash<ValueType>{}(value) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
}

std::size_t ResourceAllocator::SamplerCreateInfoHasher::operator()(const VkSamplerCreateInfo& k) const {
    // Extension structs are ignored
    auto seed = std::size_t{0};
    hash_combine(seed, static_cast<uint32_t>(k.flags));
    hash_combine(seed, static_cast<uint32_t>(k.magFilter));
    hash_combine(seed, static_cast<uint32_t>(k.minFilter));
    hash_combine(seed, static_cast<uint32_t>(k.mipmapMode));
    hash_combine(seed, static_cast<uint32_t>(k.addressModeU));
    hash_combine(seed, static_cast<uint32_t>(k.addressModeV));
    hash_combine(seed, static_cast<uint32_t>(k.addressModeW));
    hash_combine(seed, k.mipLodBias);
    hash_combine(seed, k.anisotropyEnable);
    hash_combine(seed, k.maxAnisotropy);
    hash_combine(seed, k.compareEnable);
    hash_combine(seed, static_cast<uint32_t>(k.compareOp));
    hash_combine(seed, k.minLod);
    hash_combine(seed, k.maxLod);
    hash_combine(seed, static_cast<uint32_t>(k.borderColor));
    hash_combine(seed, k.unnormalizedCoordinates);
    return seed;
}

ResourceAllocator::ResourceAllocator(RenderBackend& backend_in) : backend{backend_in} {
    if(logger == nullptr) {
        logger = SystemInterface::get().get_logger("ResourceAllocator");
        logger->set_level(spdlog::level::info);
    }

    const auto functions = VmaVulkanFunctions{
        .vkGetInstanceProcAddr = vkGetInstanceProcAddr,
        .vkGetDeviceProcAddr = vkGetDeviceProcAddr,
    };
    const auto create_info = VmaAllocatorCreateInfo{
        .flags = VMA_ALLOCATOR_CREATE_EXTERNALLY_SYNCHRONIZED_BIT,
        .physicalDevice = backend.get_physical_device(),
        .device = backend.get_device(),
        .pVulkanFunctions = &functions,
        .instance = backend.get_instance(),
        .vulkanApiVersion = VK_API_VERSION_1_3
    };
    const auto result = vmaCreateAllocator(&create_info, &vma);
    if(result != VK_SUCCESS) {
        throw std::runtime_error{fmt::format("Could not create VMA instance: {}", string_VkResult(result))};
    }
}

ResourceAllocator::~ResourceAllocator() {
    for(auto frame_idx = 0u; frame_idx < num_in_flight_frames; frame_idx++) {
        free_resources_for_frame(frame_idx);
    }

    for(auto itr = textures.begin(); itr != textures.end(); ++itr) {
        destroy_texture_immediate(&(*itr));
    }
    textures.clear();

    for(auto& buffer : buffers) {
        vmaDestroyBuffer(vma, buffer.buffer, buffer.allocation);
    }
    buffers.clear();

    const auto device = backend.get_device();
    for(const auto& [info, sampler] : sampler_cache) {
        vkDestroySampler(device, sampler, nullptr);
    }

    vmaDestroyAllocator(vma);
}

TextureHandle ResourceAllocator::create_texture(const std::string& name, const TextureCreateInfo& create_info) {
    logger->trace(
        "Creating texture {} with format {}, resolution {}x{}, {} layers, and usage {}",
        name,
        string_VkFormat(create_info.format),
        create_info.resolution.x,
        create_info.resolution.y,
        create_info.num_layers,
        magic_enum::enum_name(create_info.usage));

    if(create_info.resolution.x == 0 || create_info.resolution.y == 0) {
        throw std::runtime_error{fmt::format("Texture {} has a zero-sized resolution", name)};
    }

    const auto device = backend.get_device();

    VkImageUsageFlags vk_usage = VK_IMAGE_USAGE_SAMPLED_BIT;
    VmaAllocationCreateFlags vma_flags = {};

    switch(create_info.usage) {
    case TextureUsage::RenderTarget:
        if(is_depth_format(create_info.format)) {
            vk_usage |= VK_IMAGE_USAGE_DEPTH_STENCIL_ATTACHMENT_BIT;
        } else {
            // Render targets get cleared and copied outside of render passes, for history resets and readback
            vk_usage |= VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT | VK_IMAGE_USAGE_TRANSFER_SRC_BIT |
                VK_IMAGE_USAGE_TRANSFER_DST_BIT;
        }
        vma_flags |= VMA_ALLOCATION_CREATE_DEDICATED_MEMORY_BIT;
        break;

    case TextureUsage::StaticImage:
        vk_usage |= VK_IMAGE_USAGE_TRANSFER_DST_BIT;
        break;
    }

    const auto image_create_info = VkImageCreateInfo{
        .sType = VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO,
        .imageType = VK_IMAGE_TYPE_2D,
        .format = create_info.format,
        .extent = VkExtent3D{.width = create_info.resolution.x, .height = create_info.resolution.y, .depth = 1},
        .mipLevels = create_info.num_mips,
        .arrayLayers = create_info.num_layers,
        .samples = VK_SAMPLE_COUNT_1_BIT,
        .tiling = VK_IMAGE_TILING_OPTIMAL,
        .usage = vk_usage,
        .sharingMode = VK_SHARING_MODE_EXCLUSIVE,
        .initialLayout = VK_IMAGE_LAYOUT_UNDEFINED,
    };

    const auto allocation_info = VmaAllocationCreateInfo{
        .flags = vma_flags,
        .usage = VMA_MEMORY_USAGE_AUTO_PREFER_DEVICE,
    };

    auto texture = GpuTexture{
        .name = name,
        .create_info = image_create_info,
        .type = TextureAllocationType::Vma,
    };

    auto result = vmaCreateImage(
        vma,
        &image_create_info,
        &allocation_info,
        &texture.image,
        &texture.allocation,
        &texture.allocation_info);
    if(result != VK_SUCCESS) {
        throw std::runtime_error{fmt::format("Could not create image {}: {}", name, string_VkResult(result))};
    }

    const auto view_type = create_info.num_layers > 1 ? VK_IMAGE_VIEW_TYPE_2D_ARRAY : VK_IMAGE_VIEW_TYPE_2D;
    const auto aspect = to_aspect_flags(create_info.format);

    const auto view_create_info = VkImageViewCreateInfo{
        .sType = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO,
        .image = texture.image,
        .viewType = view_type,
        .format = create_info.format,
        .subresourceRange = {
            .aspectMask = aspect,
            .baseMipLevel = 0,
            .levelCount = create_info.num_mips,
            .baseArrayLayer = 0,
            .layerCount = create_info.num_layers,
        },
    };
    result = vkCreateImageView(device, &view_create_info, nullptr, &texture.image_view);
    if(result != VK_SUCCESS) {
        vmaDestroyImage(vma, texture.image, texture.allocation);
        throw std::runtime_error{fmt::format("Could not create image view for {}: {}", name, string_VkResult(result))};
    }

    if(create_info.num_mips == 1) {
        texture.attachment_view = texture.image_view;
    } else {
        auto rtv_create_info = view_create_info;
        rtv_create_info.subresourceRange.levelCount = 1;
        result = vkCreateImageView(device, &rtv_create_info, nullptr, &texture.attachment_view);
        if(result != VK_SUCCESS) {
            vkDestroyImageView(device, texture.image_view, nullptr);
            vmaDestroyImage(vma, texture.image, texture.allocation);
            throw std::runtime_error{
                fmt::format("Could not create attachment view for {}: {}", name, string_VkResult(result))
            };
        }
        backend.set_object_name(texture.attachment_view, fmt::format("{} RTV", name));
    }

    backend.set_object_name(texture.image, name);
    backend.set_object_name(texture.image_view, fmt::format("{} View", name));

    return &(*textures.emplace(std::move(texture)));
}

TextureHandle ResourceAllocator::register_external_texture(
    const std::string& name, const VkImage image, const VkImageView image_view, const VkImageCreateInfo& create_info
) {
    if(image == VK_NULL_HANDLE || image_view == VK_NULL_HANDLE) {
        throw std::runtime_error{fmt::format("External texture {} needs both an image and a view", name)};
    }

    logger->debug("Registering external texture {}", name);

    return &(*textures.emplace(
        GpuTexture{
            .name = name,
            .create_info = create_info,
            .image = image,
            .image_view = image_view,
            .attachment_view = image_view,
            .type = TextureAllocationType::External,
        }));
}

void ResourceAllocator::destroy_texture(const TextureHandle handle) {
    auto& cur_frame_zombies = texture_zombie_lists[backend.get_current_gpu_frame()];
    cur_frame_zombies.emplace_back(handle);
}

BufferHandle ResourceAllocator::create_buffer(const std::string& name, const size_t size, const BufferUsage usage) {
    logger->trace("Creating buffer {} with size {} and usage {}", name, size, magic_enum::enum_name(usage));

    VkBufferUsageFlags vk_usage = {};
    VmaAllocationCreateFlags vma_flags = VMA_ALLOCATION_CREATE_MAPPED_BIT |
        VMA_ALLOCATION_CREATE_HOST_ACCESS_SEQUENTIAL_WRITE_BIT;

    switch(usage) {
    case BufferUsage::VertexBuffer:
        vk_usage |= VK_BUFFER_USAGE_TRANSFER_DST_BIT | VK_BUFFER_USAGE_VERTEX_BUFFER_BIT;
        break;

    case BufferUsage::IndexBuffer:
        vk_usage |= VK_BUFFER_USAGE_TRANSFER_DST_BIT | VK_BUFFER_USAGE_INDEX_BUFFER_BIT;
        break;

    case BufferUsage::UniformBuffer:
        vk_usage |= VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT | VK_BUFFER_USAGE_TRANSFER_DST_BIT;
        break;
    }

    const auto create_info = VkBufferCreateInfo{
        .sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO,
        .size = std::max(size, static_cast<size_t>(256)),
        .usage = vk_usage,
        .sharingMode = VK_SHARING_MODE_EXCLUSIVE,
    };

    const auto vma_create_info = VmaAllocationCreateInfo{
        .flags = vma_flags,
        .usage = VMA_MEMORY_USAGE_AUTO_PREFER_DEVICE,
    };

    auto buffer = GpuBuffer{
        .name = name,
        .create_info = create_info,
    };
    const auto result = vmaCreateBuffer(
        vma,
        &create_info,
        &vma_create_info,
        &buffer.buffer,
        &buffer.allocation,
        &buffer.allocation_info);
    if(result != VK_SUCCESS) {
        throw std::runtime_error{fmt::format("Could not create buffer {}: {}", name, string_VkResult(result))};
    }

    backend.set_object_name(buffer.buffer, name);

    return &(*buffers.emplace(std::move(buffer)));
}

void* ResourceAllocator::map_buffer(const BufferHandle buffer_handle) const {
    if(buffer_handle->allocation_info.pMappedData == nullptr) {
        throw std::runtime_error{fmt::format("Buffer {} is not mapped", buffer_handle->name)};
    }

    return buffer_handle->allocation_info.pMappedData;
}

void ResourceAllocator::destroy_buffer(const BufferHandle handle) {
    auto& cur_frame_zombies = buffer_zombie_lists[backend.get_current_gpu_frame()];
    cur_frame_zombies.emplace_back(handle);
}

VkSampler ResourceAllocator::get_sampler(const VkSamplerCreateInfo& info) {
    const auto info_hash = SamplerCreateInfoHasher{}(info);

    if(const auto itr = sampler_cache.find(info_hash); itr != sampler_cache.end()) {
        return itr->second;
    }

    auto sampler = VkSampler{};
    const auto result = vkCreateSampler(backend.get_device(), &info, nullptr, &sampler);
    if(result != VK_SUCCESS) {
        throw std::runtime_error{fmt::format("Could not create sampler: {}", string_VkResult(result))};
    }

    backend.set_object_name(sampler, fmt::format("Sampler {:#x}", info_hash));

    sampler_cache.emplace(info_hash, sampler);

    return sampler;
}

void ResourceAllocator::free_resources_for_frame(const uint32_t frame_idx) {
    ZoneScoped;

    auto& tracker = backend.get_resource_access_tracker();

    auto& zombie_buffers = buffer_zombie_lists[frame_idx];
    for(auto handle : zombie_buffers) {
        tracker.forget(handle);
        vmaDestroyBuffer(vma, handle->buffer, handle->allocation);
        buffers.erase(buffers.get_iterator(handle));
    }
    zombie_buffers.clear();

    auto& zombie_textures = texture_zombie_lists[frame_idx];
    for(auto handle : zombie_textures) {
        tracker.forget(handle);
        destroy_texture_immediate(handle);
        textures.erase(textures.get_iterator(handle));
    }
    zombie_textures.clear();

    vmaSetCurrentFrameIndex(vma, frame_idx);
}

void ResourceAllocator::destroy_texture_immediate(const TextureHandle handle) {
    if(handle->type == TextureAllocationType::External) {
        return;
    }

    const auto device = backend.get_device();
    if(handle->attachment_view != handle->image_view) {
        vkDestroyImageView(device, handle->attachment_view, nullptr);
    }
    vkDestroyImageView(device, handle->image_view, nullptr);
    vmaDestroyImage(vma, handle->image, handle->allocation);
}

void ResourceAllocator::report_memory_usage() const {
    auto budgets = std::vector<VmaBudget>(VK_MAX_MEMORY_HEAPS);
    vmaGetHeapBudgets(vma, budgets.data());

    logger->info("Memory usage report");
    logger->info("Index | Block Count | Allocation Count | Block Bytes | Allocation Bytes | Total");

    auto budget_index = 0;
    for(const auto& budget : budgets) {
        if(budget.budget == 0) {
            continue;
        }

        logger->info(
            "{:>5} | {:>11} | {:>16} | {:>11} | {:>16} | {} out of {}",
            budget_index,
            budget.statistics.blockCount,
            budget.statistics.allocationCount,
            budget.statistics.blockBytes,
            budget.statistics.allocationBytes,
            budget.usage,
            budget.budget);

        budget_index++;
    }
}

VmaAllocator ResourceAllocator::get_vma() const {
    return vma;
}
