#include "screen_phase.hpp"

#include <magic_enum.hpp>
#include <spdlog/fmt/fmt.h>
#include <tracy/Tracy.hpp>

#include "core/system_interface.hpp"
#include "render/frame_uniforms.hpp"
#include "render/backend/render_backend.hpp"

static std::shared_ptr<spdlog::logger> logger;

ScreenPhase::ScreenPhase() {
    if(logger == nullptr) {
        logger = SystemInterface::get().get_logger("ScreenPhase");
    }

    auto& backend = RenderBackend::get();

    for(auto variant_index = 0u; variant_index < ScreenRenderStrategy::num_variants; variant_index++) {
        const auto strategy = ScreenRenderStrategy::from_variant_index(variant_index);
        const auto name = fmt::format(
            "screen_{}_{}_{}",
            magic_enum::enum_name(strategy.geometry),
            magic_enum::enum_name(strategy.view_mode),
            magic_enum::enum_name(strategy.mapping));

        pipelines[variant_index] = backend.begin_building_pipeline(name)
                                          .set_vertex_layout(VertexLayout::ScreenVertex)
                                          .set_vertex_shader(strategy.get_vertex_shader_path())
                                          .set_fragment_shader(strategy.get_fragment_shader_path())
                                          .build();
    }

    logger->debug("Created {} screen pipelines", pipelines.size());
}

void ScreenPhase::render(
    RenderGraph& graph, const FrameUniforms& uniforms, const ScreenRenderStrategy& strategy,
    const TextureHandle source, const TextureHandle target, const ScreenMeshBuffers& mesh, const bool clear_target
) const {
    ZoneScoped;

    if(target->get_num_layers() != num_eye_views) {
        throw std::runtime_error{
            fmt::format(
                "Screen target {} has {} layers, but we render {} views",
                target->name,
                target->get_num_layers(),
                num_eye_views)
        };
    }

    const auto pipeline = pipelines[strategy.get_variant_index()];

    auto& backend = RenderBackend::get();
    auto builder = backend.get_transient_descriptor_allocator().build_set(pipeline, 0);
    builder.bind(uniforms.cameras)
           .bind(uniforms.screen)
           .bind(source, backend.get_default_sampler());
    // Only the curved vertex shader applies the model transform, the flat one is already in world space
    if(strategy.geometry == ScreenGeometry::Curved) {
        builder.bind(uniforms.model);
    }
    const auto set = builder.build();

    graph.add_render_pass(
        {
            .name = fmt::format("screen_{}", magic_enum::enum_name(strategy.geometry)),
            .buffers = {
                {
                    .buffer = mesh.vertices,
                    .stage = VK_PIPELINE_STAGE_2_VERTEX_ATTRIBUTE_INPUT_BIT,
                    .access = VK_ACCESS_2_VERTEX_ATTRIBUTE_READ_BIT
                },
                {
                    .buffer = mesh.indices,
                    .stage = VK_PIPELINE_STAGE_2_INDEX_INPUT_BIT,
                    .access = VK_ACCESS_2_INDEX_READ_BIT
                }
            },
            .descriptor_sets = {set},
            .color_attachments = {
                {
                    .image = target,
                    .load_op = clear_target ? VK_ATTACHMENT_LOAD_OP_CLEAR : VK_ATTACHMENT_LOAD_OP_LOAD,
                    .clear_value = {.color = {.float32 = {0, 0, 0, 1}}}
                }
            },
            .view_mask = stereo_view_mask,
            .execute = [=](CommandBuffer& commands) {
                commands.bind_pipeline(pipeline);
                commands.bind_descriptor_set(0, set);

                commands.bind_vertex_buffer(0, mesh.vertices);
                commands.bind_index_buffer<uint32_t>(mesh.indices);
                commands.draw_indexed(mesh.num_indices, 1, 0, 0, 0);

                commands.clear_descriptor_set(0);
            }
        });
}
