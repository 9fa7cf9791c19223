#include "pipeline_cache.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <filesystem>

#include <spdlog/fmt/fmt.h>
#include <tracy/Tracy.hpp>
#include <vulkan/vk_enum_string_helper.h>

#include "render/backend/render_backend.hpp"
#include "core/system_interface.hpp"
#include "shared/screen_vertex.hpp"

static std::shared_ptr<spdlog::logger> logger;

static const auto pipeline_cache_path = std::filesystem::path{"cache/pipeline_cache"};

PipelineCache::PipelineCache(RenderBackend& backend_in) : backend{backend_in} {
    if(logger == nullptr) {
        logger = SystemInterface::get().get_logger("PipelineCache");
        logger->set_level(spdlog::level::info);
    }

    const auto& properties = backend.get_physical_device_properties();
    const auto data = SystemInterface::get()
                      .load_file(pipeline_cache_path)
                      .and_then(
                          [&](const auto& cache_data) -> tl::optional<std::vector<uint8_t>> {
                              if(cache_data.size() < sizeof(VkPipelineCacheHeaderVersionOne)) {
                                  return tl::nullopt;
                              }
                              auto header = VkPipelineCacheHeaderVersionOne{};
                              std::memcpy(&header, cache_data.data(), sizeof(header));
                              if(header.vendorID == properties.vendorID &&
                                  header.deviceID == properties.deviceID &&
                                  std::memcmp(header.pipelineCacheUUID, properties.pipelineCacheUUID, VK_UUID_SIZE)
                                  == 0) {
                                  return cache_data;
                              }

                              logger->info("Pipeline cache was written by a different device, ignoring it");
                              return tl::nullopt;
                          });

    const auto create_info = VkPipelineCacheCreateInfo{
        .sType = VK_STRUCTURE_TYPE_PIPELINE_CACHE_CREATE_INFO,
        .initialDataSize = data ? data->size() : 0,
        .pInitialData = data ? data->data() : nullptr,
    };

    const auto result = vkCreatePipelineCache(backend.get_device(), &create_info, nullptr, &vk_pipeline_cache);
    if(result != VK_SUCCESS) {
        throw std::runtime_error{fmt::format("Could not create pipeline cache: {}", string_VkResult(result))};
    }
}

PipelineCache::~PipelineCache() {
    const auto device = backend.get_device();
    for(const auto& pipeline : pipelines) {
        for(const auto& variant : pipeline.variants) {
            vkDestroyPipeline(device, variant.pipeline, nullptr);
        }
        vkDestroyPipelineLayout(device, pipeline.layout, nullptr);
        for(const auto set_layout : pipeline.descriptor_set_layouts) {
            vkDestroyDescriptorSetLayout(device, set_layout, nullptr);
        }
    }
    pipelines.clear();

    if(vk_pipeline_cache == VK_NULL_HANDLE) {
        return;
    }

    auto pipeline_cache_size = size_t{};
    vkGetPipelineCacheData(backend.get_device(), vk_pipeline_cache, &pipeline_cache_size, nullptr);

    auto pipeline_cache_data = std::vector<uint8_t>(pipeline_cache_size);
    const auto result = vkGetPipelineCacheData(
        backend.get_device(),
        vk_pipeline_cache,
        &pipeline_cache_size,
        pipeline_cache_data.data());
    if(result == VK_SUCCESS) {
        SystemInterface::get().write_file(
            pipeline_cache_path,
            pipeline_cache_data.data(),
            static_cast<uint32_t>(pipeline_cache_size));
    } else {
        logger->warn("Could not read back the pipeline cache: {}", string_VkResult(result));
    }

    vkDestroyPipelineCache(backend.get_device(), vk_pipeline_cache, nullptr);
    vk_pipeline_cache = VK_NULL_HANDLE;
}

GraphicsPipelineHandle PipelineCache::create_pipeline(const GraphicsPipelineBuilder& pipeline_builder) {
    auto pipeline = GraphicsPipeline{};

    pipeline.name = pipeline_builder.name;

    pipeline.vertex_shader = *pipeline_builder.vertex_shader;
    if(pipeline_builder.fragment_shader) {
        pipeline.fragment_shader = *pipeline_builder.fragment_shader;
    }

    pipeline.depth_stencil_state = pipeline_builder.depth_stencil_state;
    pipeline.raster_state = pipeline_builder.raster_state;
    pipeline.blends = pipeline_builder.blends;
    pipeline.topology = pipeline_builder.topology;

    if(pipeline_builder.vertex_layout == VertexLayout::ScreenVertex) {
        pipeline.vertex_inputs.push_back(
            {
                .binding = 0,
                .stride = sizeof(ScreenVertex),
                .inputRate = VK_VERTEX_INPUT_RATE_VERTEX
            });
        pipeline.vertex_attributes.push_back(
            {
                .location = 0,
                .binding = 0,
                .format = VK_FORMAT_R32G32B32_SFLOAT,
                .offset = offsetof(ScreenVertex, position)
            });
        pipeline.vertex_attributes.push_back(
            {
                .location = 1,
                .binding = 0,
                .format = VK_FORMAT_R32G32_SFLOAT,
                .offset = offsetof(ScreenVertex, texcoord)
            });
    }

    pipeline.descriptor_sets = pipeline_builder.descriptor_sets;
    create_pipeline_layout(pipeline);

    logger->debug("Created pipeline {}", pipeline.name);

    return &(*pipelines.emplace(std::move(pipeline)));
}

void PipelineCache::create_pipeline_layout(GraphicsPipeline& pipeline) const {
    const auto device = backend.get_device();

    pipeline.descriptor_set_layouts.reserve(pipeline.descriptor_sets.size());
    for(const auto& set_info : pipeline.descriptor_sets) {
        auto bindings = eastl::fixed_vector<VkDescriptorSetLayoutBinding, 16>{};
        for(const auto& binding : set_info.bindings) {
            bindings.emplace_back(binding);
        }

        const auto create_info = VkDescriptorSetLayoutCreateInfo{
            .sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO,
            .bindingCount = static_cast<uint32_t>(bindings.size()),
            .pBindings = bindings.data(),
        };

        auto set_layout = VkDescriptorSetLayout{};
        const auto result = vkCreateDescriptorSetLayout(device, &create_info, nullptr, &set_layout);
        if(result != VK_SUCCESS) {
            throw std::runtime_error{
                fmt::format("Could not create descriptor set layout for {}: {}", pipeline.name, string_VkResult(result))
            };
        }

        pipeline.descriptor_set_layouts.push_back(set_layout);
    }

    const auto create_info = VkPipelineLayoutCreateInfo{
        .sType = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO,
        .setLayoutCount = static_cast<uint32_t>(pipeline.descriptor_set_layouts.size()),
        .pSetLayouts = pipeline.descriptor_set_layouts.data(),
    };

    const auto result = vkCreatePipelineLayout(device, &create_info, nullptr, &pipeline.layout);
    if(result != VK_SUCCESS) {
        throw std::runtime_error{
            fmt::format("Could not create pipeline layout for {}: {}", pipeline.name, string_VkResult(result))
        };
    }

    if(!pipeline.name.empty()) {
        backend.set_object_name(pipeline.layout, fmt::format("{} Layout", pipeline.name));
    }
}

VkPipeline PipelineCache::get_pipeline_for_dynamic_rendering(
    const GraphicsPipelineHandle pipeline, const std::span<const VkFormat> color_attachment_formats,
    const tl::optional<VkFormat> depth_format, const uint32_t view_mask
) const {
    ZoneScoped;

    const auto existing = std::find_if(
        pipeline->variants.begin(),
        pipeline->variants.end(),
        [&](const PipelineVariant& variant) {
            return variant.view_mask == view_mask &&
                variant.depth_format == depth_format &&
                std::equal(
                    variant.color_formats.begin(),
                    variant.color_formats.end(),
                    color_attachment_formats.begin(),
                    color_attachment_formats.end());
        });
    if(existing != pipeline->variants.end()) {
        return existing->pipeline;
    }

    const auto device = backend.get_device();

    auto create_shader_module = [&](const std::vector<uint8_t>& code) {
        const auto module_create_info = VkShaderModuleCreateInfo{
            .sType = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO,
            .codeSize = code.size(),
            .pCode = reinterpret_cast<const uint32_t*>(code.data()),
        };
        auto module = VkShaderModule{};
        const auto result = vkCreateShaderModule(device, &module_create_info, nullptr, &module);
        if(result != VK_SUCCESS) {
            throw std::runtime_error{
                fmt::format("Could not create shader module for {}: {}", pipeline->name, string_VkResult(result))
            };
        }
        return module;
    };

    auto stages = eastl::fixed_vector<VkPipelineShaderStageCreateInfo, 2>{};
    stages.push_back(
        VkPipelineShaderStageCreateInfo{
            .sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO,
            .stage = VK_SHADER_STAGE_VERTEX_BIT,
            .module = create_shader_module(pipeline->vertex_shader),
            .pName = "main",
        });

    if(!pipeline->fragment_shader.empty()) {
        stages.push_back(
            VkPipelineShaderStageCreateInfo{
                .sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO,
                .stage = VK_SHADER_STAGE_FRAGMENT_BIT,
                .module = create_shader_module(pipeline->fragment_shader),
                .pName = "main",
            });
    }

    const auto vertex_input_state = VkPipelineVertexInputStateCreateInfo{
        .sType = VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_STATE_CREATE_INFO,
        .vertexBindingDescriptionCount = static_cast<uint32_t>(pipeline->vertex_inputs.size()),
        .pVertexBindingDescriptions = pipeline->vertex_inputs.data(),
        .vertexAttributeDescriptionCount = static_cast<uint32_t>(pipeline->vertex_attributes.size()),
        .pVertexAttributeDescriptions = pipeline->vertex_attributes.data(),
    };

    const auto input_assembly_state = VkPipelineInputAssemblyStateCreateInfo{
        .sType = VK_STRUCTURE_TYPE_PIPELINE_INPUT_ASSEMBLY_STATE_CREATE_INFO,
        .topology = pipeline->topology,
    };

    // Dynamic viewport and scissor state
    const auto viewport_state = VkPipelineViewportStateCreateInfo{
        .sType = VK_STRUCTURE_TYPE_PIPELINE_VIEWPORT_STATE_CREATE_INFO,
        .viewportCount = 1,
        .scissorCount = 1,
    };

    const auto multisample_state = VkPipelineMultisampleStateCreateInfo{
        .sType = VK_STRUCTURE_TYPE_PIPELINE_MULTISAMPLE_STATE_CREATE_INFO,
        .rasterizationSamples = VK_SAMPLE_COUNT_1_BIT
    };

    if(pipeline->blends.size() < color_attachment_formats.size()) {
        throw std::runtime_error{
            fmt::format(
                "Pipeline {} has blend state for {} attachments, but the pass has {}",
                pipeline->name,
                pipeline->blends.size(),
                color_attachment_formats.size())
        };
    }

    const auto color_blend_state = VkPipelineColorBlendStateCreateInfo{
        .sType = VK_STRUCTURE_TYPE_PIPELINE_COLOR_BLEND_STATE_CREATE_INFO,
        .attachmentCount = static_cast<uint32_t>(color_attachment_formats.size()),
        .pAttachments = pipeline->blends.data(),
    };

    constexpr auto dynamic_states = std::array{
        VK_DYNAMIC_STATE_VIEWPORT,
        VK_DYNAMIC_STATE_SCISSOR,
    };

    const auto dynamic_state = VkPipelineDynamicStateCreateInfo{
        .sType = VK_STRUCTURE_TYPE_PIPELINE_DYNAMIC_STATE_CREATE_INFO,
        .dynamicStateCount = static_cast<uint32_t>(dynamic_states.size()),
        .pDynamicStates = dynamic_states.data(),
    };

    const auto rendering_info = VkPipelineRenderingCreateInfo{
        .sType = VK_STRUCTURE_TYPE_PIPELINE_RENDERING_CREATE_INFO,
        .viewMask = view_mask,
        .colorAttachmentCount = static_cast<uint32_t>(color_attachment_formats.size()),
        .pColorAttachmentFormats = color_attachment_formats.data(),
        .depthAttachmentFormat = depth_format.value_or(VK_FORMAT_UNDEFINED),
    };

    const auto create_info = VkGraphicsPipelineCreateInfo{
        .sType = VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO,
        .pNext = &rendering_info,
        .stageCount = static_cast<uint32_t>(stages.size()),
        .pStages = stages.data(),
        .pVertexInputState = &vertex_input_state,
        .pInputAssemblyState = &input_assembly_state,
        .pViewportState = &viewport_state,
        .pRasterizationState = &pipeline->raster_state,
        .pMultisampleState = &multisample_state,
        .pDepthStencilState = &pipeline->depth_stencil_state,
        .pColorBlendState = &color_blend_state,
        .pDynamicState = &dynamic_state,
        .layout = pipeline->layout
    };

    logger->trace("About to compile PSO {} with view mask {:#b}", pipeline->name, view_mask);

    auto variant = PipelineVariant{
        .color_formats = {color_attachment_formats.begin(), color_attachment_formats.end()},
        .depth_format = depth_format,
        .view_mask = view_mask,
    };
    const auto result = vkCreateGraphicsPipelines(
        device,
        vk_pipeline_cache,
        1,
        &create_info,
        nullptr,
        &variant.pipeline);

    for(const auto& stage : stages) {
        vkDestroyShaderModule(device, stage.module, nullptr);
    }

    if(result != VK_SUCCESS) {
        throw std::runtime_error{
            fmt::format("Could not create pipeline {}: {}", pipeline->name, string_VkResult(result))
        };
    }

    if(!pipeline->name.empty()) {
        backend.set_object_name(variant.pipeline, pipeline->name);
    }

    pipeline->variants.push_back(variant);

    return variant.pipeline;
}
