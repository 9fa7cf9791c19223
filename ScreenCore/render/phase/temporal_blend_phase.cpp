#include "temporal_blend_phase.hpp"

#include <spdlog/fmt/fmt.h>
#include <tracy/Tracy.hpp>

#include "render/frame_uniforms.hpp"
#include "render/backend/render_backend.hpp"

static constexpr auto write_all_channels = VkPipelineColorBlendAttachmentState{
    .colorWriteMask = VK_COLOR_COMPONENT_R_BIT | VK_COLOR_COMPONENT_G_BIT | VK_COLOR_COMPONENT_B_BIT |
    VK_COLOR_COMPONENT_A_BIT
};

TemporalBlendPhase::TemporalBlendPhase() {
    blend_pso = RenderBackend::get()
                .begin_building_pipeline("temporal_blend")
                .set_vertex_shader("shaders/fullscreen.vert.spv")
                .set_fragment_shader("shaders/temporal_blend.frag.spv")
                .set_blend_state(0, write_all_channels)
                .set_blend_state(1, write_all_channels)
                .build();
}

void TemporalBlendPhase::render(
    RenderGraph& graph, const FrameUniforms& uniforms, const TextureHandle current, const TextureHandle history_read,
    const TextureHandle display_out, const TextureHandle history_write
) const {
    ZoneScoped;

    if(history_read == history_write) {
        throw std::runtime_error{
            fmt::format("Temporal blend would read and write history texture {} in the same pass", history_read->name)
        };
    }

    auto& backend = RenderBackend::get();
    const auto sampler = backend.get_default_sampler();
    const auto set = backend.get_transient_descriptor_allocator()
                            .build_set(blend_pso, 0)
                            .bind(uniforms.temporal)
                            .bind(current, sampler)
                            .bind(history_read, sampler)
                            .build();

    graph.add_render_pass(
        {
            .name = "temporal_blend",
            .descriptor_sets = {set},
            .color_attachments = {
                {
                    .image = display_out,
                    .load_op = VK_ATTACHMENT_LOAD_OP_DONT_CARE
                },
                {
                    .image = history_write,
                    .load_op = VK_ATTACHMENT_LOAD_OP_DONT_CARE
                }
            },
            .view_mask = stereo_view_mask,
            .execute = [=, pipeline = blend_pso](CommandBuffer& commands) {
                commands.bind_pipeline(pipeline);
                commands.bind_descriptor_set(0, set);

                commands.draw_triangle();

                commands.clear_descriptor_set(0);
            }
        });
}
