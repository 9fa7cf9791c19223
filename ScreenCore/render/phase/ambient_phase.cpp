#include "ambient_phase.hpp"

#include <tracy/Tracy.hpp>

#include "render/frame_uniforms.hpp"
#include "render/backend/render_backend.hpp"

AmbientPhase::AmbientPhase() {
    ambient_pso = RenderBackend::get()
                  .begin_building_pipeline("ambient_vignette")
                  .set_vertex_shader("shaders/fullscreen.vert.spv")
                  .set_fragment_shader("shaders/ambient.frag.spv")
                  .build();
}

void AmbientPhase::render(
    RenderGraph& graph, const FrameUniforms& uniforms, const TextureHandle blended, const TextureHandle ambient_out
) const {
    ZoneScoped;

    auto& backend = RenderBackend::get();
    const auto set = backend.get_transient_descriptor_allocator()
                            .build_set(ambient_pso, 0)
                            .bind(uniforms.screen)
                            .bind(blended, backend.get_default_sampler())
                            .build();

    graph.add_render_pass(
        {
            .name = "ambient",
            .descriptor_sets = {set},
            .color_attachments = {
                {
                    .image = ambient_out,
                    .load_op = VK_ATTACHMENT_LOAD_OP_DONT_CARE
                }
            },
            .execute = [=, pipeline = ambient_pso](CommandBuffer& commands) {
                commands.bind_pipeline(pipeline);
                commands.bind_descriptor_set(0, set);

                commands.draw_triangle();

                commands.clear_descriptor_set(0);
            }
        });
}
