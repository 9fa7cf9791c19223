#include "descriptor_set.hpp"

#include <algorithm>

#include <magic_enum.hpp>
#include <spdlog/fmt/fmt.h>
#include <tracy/Tracy.hpp>

#include "render/backend/descriptor_set_allocator.hpp"
#include "render/backend/render_backend.hpp"

static VkPipelineStageFlags2 to_pipeline_stage(VkShaderStageFlags stage_flags);

template <typename UsageList, typename Token>
static void merge_usage(UsageList& usages, const Token& token, auto&& matches) {
    if(auto itr = std::find_if(usages.begin(), usages.end(), matches); itr != usages.end()) {
        itr->access |= token.access;
        itr->stage |= token.stage;
    } else {
        usages.emplace_back(token);
    }
}

void DescriptorSet::get_resource_usage_information(
    TextureUsageList& texture_usages, BufferUsageList& buffer_usages
) const {
    for(auto binding_idx = 0u; binding_idx < bindings.size(); binding_idx++) {
        const auto& binding_info = set_info.bindings.at(binding_idx);
        const auto& resource = bindings[binding_idx];
        const auto stage = to_pipeline_stage(binding_info.stageFlags);

        if(binding_info.descriptorType == VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER) {
            const auto token = BufferUsageToken{
                .buffer = resource.buffer,
                .stage = stage,
                .access = VK_ACCESS_2_UNIFORM_READ_BIT
            };
            merge_usage(
                buffer_usages,
                token,
                [&](const BufferUsageToken& usage) { return usage.buffer == token.buffer; });

        } else if(binding_info.descriptorType == VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER) {
            const auto token = TextureUsageToken{
                .texture = resource.combined_image_sampler.texture,
                .stage = stage,
                .access = VK_ACCESS_2_SHADER_SAMPLED_READ_BIT,
                .layout = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL
            };
            merge_usage(
                texture_usages,
                token,
                [&](const TextureUsageToken& usage) { return usage.texture == token.texture; });
        }
    }
}

DescriptorSetBuilder::DescriptorSetBuilder(
    RenderBackend& backend_in, DescriptorSetAllocator& allocator_in, const VkDescriptorSetLayout layout_in,
    DescriptorSetInfo set_info_in, const std::string_view name_in
) : backend{&backend_in}, allocator{&allocator_in}, layout{layout_in}, set_info{std::move(set_info_in)},
    name{name_in} {
    bindings.resize(set_info.bindings.size());
}

void DescriptorSetBuilder::check_binding(const VkDescriptorType expected_type) const {
    if(binding_index >= set_info.bindings.size()) {
        throw std::runtime_error{
            fmt::format(
                "Tried to bind a resource to binding {} of {}, but that binding does not exist",
                binding_index,
                name)
        };
    }

    const auto actual_type = set_info.bindings[binding_index].descriptorType;
    if(actual_type != expected_type) {
        throw std::runtime_error{
            fmt::format(
                "Binding {} of {} is a {}, not a {}",
                binding_index,
                name,
                magic_enum::enum_name(actual_type),
                magic_enum::enum_name(expected_type))
        };
    }
}

DescriptorSetBuilder& DescriptorSetBuilder::bind(const BufferHandle buffer) {
    check_binding(VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER);

    bindings[binding_index].buffer = buffer;

    binding_index++;

    return *this;
}

DescriptorSetBuilder& DescriptorSetBuilder::bind(const TextureHandle texture, const VkSampler vk_sampler) {
    check_binding(VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER);

    bindings[binding_index].combined_image_sampler = {texture, vk_sampler};

    binding_index++;

    return *this;
}

DescriptorSet DescriptorSetBuilder::build() {
    ZoneScoped;

    const auto descriptor_set = allocator->allocate(layout);

    // Sized up front so the info pointers stay valid until vkUpdateDescriptorSets
    auto buffer_infos = eastl::fixed_vector<VkDescriptorBufferInfo, 16>{};
    auto image_infos = eastl::fixed_vector<VkDescriptorImageInfo, 16>{};
    auto writes = eastl::fixed_vector<VkWriteDescriptorSet, 16>{};
    buffer_infos.reserve(bindings.size());
    image_infos.reserve(bindings.size());

    for(auto binding_idx = 0u; binding_idx < bindings.size(); binding_idx++) {
        const auto& binding_info = set_info.bindings.at(binding_idx);
        const auto& resource = bindings[binding_idx];

        auto write = VkWriteDescriptorSet{
            .sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET,
            .dstSet = descriptor_set,
            .dstBinding = binding_idx,
            .descriptorCount = 1,
            .descriptorType = binding_info.descriptorType,
        };

        if(binding_info.descriptorType == VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER) {
            if(resource.buffer == nullptr) {
                throw std::runtime_error{fmt::format("No buffer bound to binding {} of {}", binding_idx, name)};
            }
            write.pBufferInfo = &buffer_infos.emplace_back(
                VkDescriptorBufferInfo{
                    .buffer = resource.buffer->buffer,
                    .offset = 0,
                    .range = VK_WHOLE_SIZE
                });

        } else if(binding_info.descriptorType == VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER) {
            if(resource.combined_image_sampler.texture == nullptr) {
                throw std::runtime_error{fmt::format("No texture bound to binding {} of {}", binding_idx, name)};
            }
            write.pImageInfo = &image_infos.emplace_back(
                VkDescriptorImageInfo{
                    .sampler = resource.combined_image_sampler.sampler,
                    .imageView = resource.combined_image_sampler.texture->image_view,
                    .imageLayout = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL
                });

        } else {
            throw std::runtime_error{
                fmt::format(
                    "Unsupported descriptor type {} in {}",
                    magic_enum::enum_name(binding_info.descriptorType),
                    name)
            };
        }

        writes.emplace_back(write);
    }

    vkUpdateDescriptorSets(
        backend->get_device(),
        static_cast<uint32_t>(writes.size()),
        writes.data(),
        0,
        nullptr);

    backend->set_object_name(descriptor_set, name);

    return DescriptorSet{
        .descriptor_set = descriptor_set,
        .set_info = std::move(set_info),
        .bindings = std::move(bindings)
    };
}

VkPipelineStageFlags2 to_pipeline_stage(const VkShaderStageFlags stage_flags) {
    VkPipelineStageFlags2 flags = 0;

    if(stage_flags & VK_SHADER_STAGE_VERTEX_BIT) {
        flags |= VK_PIPELINE_STAGE_2_VERTEX_SHADER_BIT;
    }
    if(stage_flags & VK_SHADER_STAGE_FRAGMENT_BIT) {
        flags |= VK_PIPELINE_STAGE_2_FRAGMENT_SHADER_BIT;
    }

    return flags;
}
