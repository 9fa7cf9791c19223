#include "render_graph.hpp"

#include <bit>

#include <spdlog/logger.h>

#include "render/backend/render_backend.hpp"
#include "render/backend/resource_access_tracker.hpp"
#include "render/backend/gpu_texture.hpp"
#include "render/backend/utils.hpp"
#include "core/system_interface.hpp"

static std::shared_ptr<spdlog::logger> logger;

RenderGraph::RenderGraph(RenderBackend& backend_in) :
    backend{backend_in}, access_tracker{backend.get_resource_access_tracker()},
    cmds{backend.create_graphics_command_buffer("Render graph command buffer")} {
    if(logger == nullptr) {
        logger = SystemInterface::get().get_logger("RenderGraph");
        logger->set_level(spdlog::level::info);
    }

    cmds.begin();
}

void RenderGraph::add_clear_pass(const ClearPass& pass) {
    if(is_depth_format(pass.image->create_info.format)) {
        throw std::runtime_error{fmt::format("Cannot color-clear depth image {}", pass.image->name)};
    }

    add_pass(
        {
            .name = pass.name,
            .textures = {
                {
                    pass.image, VK_PIPELINE_STAGE_2_CLEAR_BIT, VK_ACCESS_2_TRANSFER_WRITE_BIT,
                    VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL
                }
            },
            .execute = [=](const CommandBuffer& commands) {
                commands.clear_color_image(pass.image, pass.clear_color);
            }
        });
}

void RenderGraph::add_pass(ComputePass pass) {
    num_passes++;
    if(!pass.name.empty()) {
        logger->trace("Adding pass {}", pass.name);

        cmds.begin_label(pass.name);
    }

    for(const auto& set : pass.descriptor_sets) {
        set.get_resource_usage_information(pass.textures, pass.buffers);
    }

    update_accesses_and_issue_barriers(pass.textures, pass.buffers);

    {
        ZoneTransientN(zone, pass.name.c_str(), true);
#if defined(TRACY_ENABLE)
        TracyVkZoneTransient(cmds.get_tracy_context(), vk_zone, cmds.get_vk_commands(), pass.name.c_str(), true)
#endif

        pass.execute(cmds);
    }

    if(!pass.name.empty()) {
        cmds.end_label();
    }
}

void RenderGraph::add_render_pass(DynamicRenderingPass pass) {
    num_passes++;

    logger->trace("Adding dynamic render pass {}", pass.name);

    for(const auto& set : pass.descriptor_sets) {
        set.get_resource_usage_information(pass.textures, pass.buffers);
    }

    update_accesses_and_issue_barriers(pass.textures, pass.buffers);

    auto num_layers = 1u;
    for(const auto& attachment : pass.color_attachments) {
        access_tracker.set_resource_usage(
            TextureUsageToken{
                .texture = attachment.image,
                .stage = VK_PIPELINE_STAGE_2_COLOR_ATTACHMENT_OUTPUT_BIT,
                .access = VK_ACCESS_2_COLOR_ATTACHMENT_READ_BIT | VK_ACCESS_2_COLOR_ATTACHMENT_WRITE_BIT,
                .layout = VK_IMAGE_LAYOUT_ATTACHMENT_OPTIMAL
            });

        // Assumes that all render targets have the same number of layers
        num_layers = attachment.image->get_num_layers();
    }

    if(pass.depth_attachment) {
        access_tracker.set_resource_usage(
            TextureUsageToken{
                .texture = pass.depth_attachment->image,
                .stage = VK_PIPELINE_STAGE_2_EARLY_FRAGMENT_TESTS_BIT | VK_PIPELINE_STAGE_2_LATE_FRAGMENT_TESTS_BIT,
                .access = VK_ACCESS_2_DEPTH_STENCIL_ATTACHMENT_READ_BIT |
                VK_ACCESS_2_DEPTH_STENCIL_ATTACHMENT_WRITE_BIT,
                .layout = VK_IMAGE_LAYOUT_ATTACHMENT_OPTIMAL
            });

        num_layers = pass.depth_attachment->image->get_num_layers();
    }

    if(pass.view_mask) {
        // Every view needs a layer to render into
        const auto highest_view = static_cast<uint32_t>(std::bit_width(*pass.view_mask));
        if(highest_view > num_layers) {
            throw std::runtime_error{
                fmt::format(
                    "Render pass {} has view mask {:#b} but its attachments only have {} layers",
                    pass.name,
                    *pass.view_mask,
                    num_layers)
            };
        }
    }

    cmds.begin_label(pass.name);
    {
        ZoneTransientN(zone, pass.name.c_str(), true);
#if defined(TRACY_ENABLE)
        TracyVkZoneTransient(backend.get_tracy_context(), tracy_zone, cmds.get_vk_commands(), pass.name.c_str(), true)
#endif

        access_tracker.issue_barriers(cmds);

        auto render_area_size = glm::uvec2{};
        if(pass.depth_attachment) {
            render_area_size = pass.depth_attachment->image->get_resolution();
        } else if(!pass.color_attachments.empty()) {
            render_area_size = pass.color_attachments[0].image->get_resolution();
        }

        const auto rendering_info = RenderingInfo{
            .render_area_begin = {},
            .render_area_size = render_area_size,
            .layer_count = num_layers,
            .view_mask = pass.view_mask.value_or(0),
            .color_attachments = pass.color_attachments,
            .depth_attachment = pass.depth_attachment,
        };

        cmds.begin_rendering(rendering_info);

        pass.execute(cmds);

        cmds.end_rendering();
    }
    cmds.end_label();
}

void RenderGraph::update_accesses_and_issue_barriers(
    const TextureUsageList& textures, const BufferUsageList& buffers
) const {
    for(const auto& buffer_token : buffers) {
        access_tracker.set_resource_usage(buffer_token);
    }

    for(const auto& texture_token : textures) {
        access_tracker.set_resource_usage(texture_token);
    }

    access_tracker.issue_barriers(cmds);
}

void RenderGraph::begin_label(const std::string& label) {
    cmds.begin_label(label);
}

void RenderGraph::end_label() {
    cmds.end_label();
}

void RenderGraph::finish() const {
    cmds.end();
}

CommandBuffer&& RenderGraph::extract_command_buffer() {
    return std::move(cmds);
}

void RenderGraph::set_resource_usage(const TextureUsageToken& texture_usage_token, const bool skip_barrier) const {
    access_tracker.set_resource_usage(texture_usage_token, skip_barrier);
}

uint32_t RenderGraph::get_num_passes() const {
    return num_passes;
}
