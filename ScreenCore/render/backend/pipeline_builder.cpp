#include "pipeline_builder.hpp"

#include <algorithm>
#include <cstddef>
#include <span>

#include <magic_enum.hpp>
#include <spirv_reflect.h>
#include <spdlog/fmt/fmt.h>

#include "render/backend/pipeline_cache.hpp"
#include "core/system_interface.hpp"
#include "shared/screen_vertex.hpp"

static std::shared_ptr<spdlog::logger> logger;

constexpr static uint32_t POSITION_LOCATION = 0;
constexpr static uint32_t TEXCOORD_LOCATION = 1;

static VkDescriptorType to_vk_type(SpvReflectDescriptorType type);

static void init_logger() {
    logger = SystemInterface::get().get_logger("GraphicsPipelineBuilder");
    logger->set_level(spdlog::level::info);
}

static void check_reflection(const SpvReflectResult result, const std::string_view shader_name) {
    if(result != SPV_REFLECT_RESULT_SUCCESS) {
        throw std::runtime_error{
            fmt::format("Reflection failed on shader {}: {}", shader_name, magic_enum::enum_name(result))
        };
    }
}

static bool collect_descriptor_sets(
    const std::string_view shader_name,
    const std::span<SpvReflectDescriptorSet* const> sets,
    const VkShaderStageFlagBits shader_stage,
    eastl::fixed_vector<DescriptorSetInfo, 4>& descriptor_sets
) {
    bool has_error = false;
    for(const auto* set : sets) {
        if(descriptor_sets.size() <= set->set) {
            descriptor_sets.resize(set->set + 1);
        }
        auto& set_info = descriptor_sets[set->set];

        for(const auto* binding : std::span{set->bindings, set->bindings + set->binding_count}) {
            if(binding->count != 1) {
                logger->error(
                    "Shader {} binding {}.{} is an array, descriptor arrays are not supported",
                    shader_name,
                    set->set,
                    binding->binding);
                has_error = true;
                continue;
            }

            if(set_info.bindings.size() <= binding->binding) {
                set_info.bindings.resize(binding->binding + 1);
            }

            auto& existing = set_info.bindings[binding->binding];
            const auto vk_type = to_vk_type(binding->descriptor_type);
            if(existing.stageFlags != 0) {
                // Already declared by another stage
                if(existing.descriptorType != vk_type) {
                    logger->error(
                        "Binding {}.{} is a {} in shader {}, but it was a {} earlier",
                        set->set,
                        binding->binding,
                        magic_enum::enum_name(vk_type),
                        shader_name,
                        magic_enum::enum_name(existing.descriptorType));
                    has_error = true;
                }
                existing.stageFlags |= shader_stage;
                continue;
            }

            logger->trace(
                "Adding descriptor {}.{} of type {} for shader stage {}",
                set->set,
                binding->binding,
                magic_enum::enum_name(vk_type),
                magic_enum::enum_name(shader_stage));

            existing = DescriptorInfo{
                {
                    .binding = binding->binding,
                    .descriptorType = vk_type,
                    .descriptorCount = 1,
                    .stageFlags = static_cast<VkShaderStageFlags>(shader_stage),
                    .pImmutableSamplers = nullptr
                },
                (binding->decoration_flags & SPV_REFLECT_DECORATION_NON_WRITABLE) != 0
            };
        }
    }

    return has_error;
}

bool collect_bindings(
    const std::vector<uint8_t>& shader_instructions,
    const std::string_view shader_name,
    const VkShaderStageFlagBits shader_stage,
    eastl::fixed_vector<DescriptorSetInfo, 4>& descriptor_sets
) {
    if(logger == nullptr) {
        init_logger();
    }

    const auto shader_module = spv_reflect::ShaderModule{shader_instructions, SPV_REFLECT_MODULE_FLAG_NO_COPY};
    check_reflection(shader_module.GetResult(), shader_name);

    bool has_error = false;

    uint32_t set_count;
    check_reflection(shader_module.EnumerateDescriptorSets(&set_count, nullptr), shader_name);
    auto sets = std::vector<SpvReflectDescriptorSet*>(set_count);
    check_reflection(shader_module.EnumerateDescriptorSets(&set_count, sets.data()), shader_name);

    has_error |= collect_descriptor_sets(shader_name, sets, shader_stage, descriptor_sets);

    uint32_t constant_count;
    check_reflection(shader_module.EnumeratePushConstantBlocks(&constant_count, nullptr), shader_name);
    if(constant_count > 0) {
        throw std::runtime_error{
            fmt::format("Shader {} declares push constants. Use a uniform buffer instead", shader_name)
        };
    }

    return has_error;
}

/**
 * Checks that the vertex shader only reads inputs the vertex layout provides
 */
static void validate_vertex_inputs(
    const std::vector<uint8_t>& shader_instructions, const std::string_view shader_name, const VertexLayout layout
) {
    const auto shader_module = spv_reflect::ShaderModule{shader_instructions, SPV_REFLECT_MODULE_FLAG_NO_COPY};
    check_reflection(shader_module.GetResult(), shader_name);

    uint32_t input_count;
    check_reflection(shader_module.EnumerateInputVariables(&input_count, nullptr), shader_name);
    auto inputs = std::vector<SpvReflectInterfaceVariable*>(input_count);
    check_reflection(shader_module.EnumerateInputVariables(&input_count, inputs.data()), shader_name);

    for(const auto* input : inputs) {
        if((input->decoration_flags & SPV_REFLECT_DECORATION_BUILT_IN) != 0) {
            continue;
        }

        const auto provided = layout == VertexLayout::ScreenVertex &&
            (input->location == POSITION_LOCATION || input->location == TEXCOORD_LOCATION);
        if(!provided) {
            throw std::runtime_error{
                fmt::format(
                    "Vertex shader {} reads input location {}, which vertex layout {} does not provide",
                    shader_name,
                    input->location,
                    magic_enum::enum_name(layout))
            };
        }
    }
}

GraphicsPipelineBuilder::GraphicsPipelineBuilder(PipelineCache& cache_in) : cache{cache_in} {
    if(logger == nullptr) {
        init_logger();
    }

    set_depth_state({});
    set_raster_state({});
    set_blend_state(
        0,
        {
            .colorWriteMask = VK_COLOR_COMPONENT_R_BIT | VK_COLOR_COMPONENT_G_BIT | VK_COLOR_COMPONENT_B_BIT |
            VK_COLOR_COMPONENT_A_BIT
        });
}

GraphicsPipelineBuilder& GraphicsPipelineBuilder::set_name(const std::string_view name_in) {
    name = name_in;

    return *this;
}

GraphicsPipelineBuilder& GraphicsPipelineBuilder::set_vertex_layout(const VertexLayout layout) {
    vertex_layout = layout;

    return *this;
}

GraphicsPipelineBuilder& GraphicsPipelineBuilder::set_topology(const VkPrimitiveTopology topology_in) {
    topology = topology_in;

    return *this;
}

GraphicsPipelineBuilder& GraphicsPipelineBuilder::set_vertex_shader(const std::filesystem::path& vertex_path) {
    if(vertex_shader) {
        throw std::runtime_error{fmt::format("Vertex shader for {} already set", name)};
    }

    vertex_shader = SystemInterface::get().load_file(vertex_path);
    if(!vertex_shader) {
        throw std::runtime_error{fmt::format("Could not load vertex shader {}", vertex_path.string())};
    }

    vertex_shader_name = vertex_path.string();

    logger->debug("Beginning reflection on vertex shader {}", vertex_shader_name);

    const auto has_error = collect_bindings(
        *vertex_shader,
        vertex_shader_name,
        VK_SHADER_STAGE_VERTEX_BIT,
        descriptor_sets);
    if(has_error) {
        logger->warn("Errors encountered when parsing shader {}", vertex_shader_name);
    }

    return *this;
}

GraphicsPipelineBuilder& GraphicsPipelineBuilder::set_fragment_shader(const std::filesystem::path& fragment_path) {
    if(fragment_shader) {
        throw std::runtime_error{fmt::format("Fragment shader for {} already set", name)};
    }

    fragment_shader = SystemInterface::get().load_file(fragment_path);
    if(!fragment_shader) {
        throw std::runtime_error{fmt::format("Could not load fragment shader {}", fragment_path.string())};
    }

    fragment_shader_name = fragment_path.string();

    logger->debug("Beginning reflection on fragment shader {}", fragment_shader_name);

    const auto has_error = collect_bindings(
        *fragment_shader,
        fragment_shader_name,
        VK_SHADER_STAGE_FRAGMENT_BIT,
        descriptor_sets);
    if(has_error) {
        logger->warn("Errors encountered when parsing shader {}", fragment_shader_name);
    }

    return *this;
}

GraphicsPipelineBuilder& GraphicsPipelineBuilder::set_depth_state(const DepthStencilState& depth_stencil) {
    depth_stencil_state = {
        .sType = VK_STRUCTURE_TYPE_PIPELINE_DEPTH_STENCIL_STATE_CREATE_INFO,
        .depthTestEnable = depth_stencil.enable_depth_test ? VK_TRUE : VK_FALSE,
        .depthWriteEnable = depth_stencil.enable_depth_write ? VK_TRUE : VK_FALSE,
        .depthCompareOp = depth_stencil.compare_op,
        .depthBoundsTestEnable = VK_FALSE,
        .stencilTestEnable = VK_FALSE,
    };

    return *this;
}

GraphicsPipelineBuilder& GraphicsPipelineBuilder::set_raster_state(const RasterState& raster_state_in) {
    raster_state = VkPipelineRasterizationStateCreateInfo{
        .sType = VK_STRUCTURE_TYPE_PIPELINE_RASTERIZATION_STATE_CREATE_INFO,
        .polygonMode = raster_state_in.polygon_mode,
        .cullMode = raster_state_in.cull_mode,
        .frontFace = raster_state_in.front_face,
        .lineWidth = raster_state_in.line_width,
    };

    return *this;
}

GraphicsPipelineBuilder& GraphicsPipelineBuilder::set_blend_state(
    const uint32_t color_target_index, const VkPipelineColorBlendAttachmentState& blend
) {
    if(blends.size() <= color_target_index) {
        blends.resize(color_target_index + 1);
    }

    blends[color_target_index] = blend;

    return *this;
}

GraphicsPipelineHandle GraphicsPipelineBuilder::build() {
    if(!vertex_shader) {
        throw std::runtime_error{fmt::format("Pipeline {} has no vertex shader", name)};
    }

    validate_vertex_inputs(*vertex_shader, vertex_shader_name, vertex_layout);

    return cache.create_pipeline(*this);
}

VkDescriptorType to_vk_type(const SpvReflectDescriptorType type) {
    switch(type) {
    case SPV_REFLECT_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER:
        return VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;

    case SPV_REFLECT_DESCRIPTOR_TYPE_UNIFORM_BUFFER:
        return VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;

    default:
        throw std::runtime_error{
            fmt::format("Unsupported descriptor type {}", magic_enum::enum_name(type))
        };
    }
}
