#include "screen_renderer.hpp"

#include <cstring>

#include <magic_enum.hpp>
#include <spdlog/fmt/fmt.h>
#include <tracy/Tracy.hpp>
#include <vulkan/vk_enum_string_helper.h>

#include "core/app_config.hpp"
#include "core/system_interface.hpp"
#include "render/camera_array.hpp"
#include "render/frame_plan.hpp"
#include "render/plane_mesh.hpp"
#include "render/screen_settings.hpp"
#include "render/backend/render_backend.hpp"

static std::shared_ptr<spdlog::logger> logger;

/**
 * Screen image and history keep extra precision, so that slow decay doesn't band
 */
constexpr static auto blend_format = VK_FORMAT_R16G16B16A16_SFLOAT;

constexpr static auto output_format = VK_FORMAT_R8G8B8A8_SRGB;

ScreenRenderer::ScreenRenderer(const AppConfig& config) :
    screen_transform{config.distance, config.scale, 1.f} {
    if(logger == nullptr) {
        logger = SystemInterface::get().get_logger("ScreenRenderer");
    }

    strategy.mapping = ScreenSettings::get().stereo_mapping;

    create_uniform_buffers();

    rebuild_screen_mesh(ScreenSettings::get().mesh_resolution);
    rebuild_flat_mesh();

    logger->info("Initialized screen renderer");
}

void ScreenRenderer::apply_config(const AppConfig& config) {
    screen_transform.change_distance(config.distance);
    screen_transform.change_scale(config.scale);

    rebuild_flat_mesh();
}

void ScreenRenderer::set_source_texture(
    const TextureHandle source, const glm::uvec2 source_resolution, const StereoMode stereo_mode_in
) {
    source_texture = source;
    stereo_mode = stereo_mode_in;

    const auto aspect_ratio = get_eye_aspect_ratio(source_resolution, stereo_mode);
    screen_transform.change_aspect_ratio(aspect_ratio);

    rebuild_flat_mesh();

    logger->info(
        "Source is now {} ({}x{}, {}), screen aspect ratio {}",
        source->name,
        source_resolution.x,
        source_resolution.y,
        magic_enum::enum_name(stereo_mode),
        aspect_ratio);
}

void ScreenRenderer::set_output_resolution(const glm::uvec2 new_output_resolution) {
    if(new_output_resolution == output_resolution && display_output != nullptr) {
        return;
    }

    output_resolution = new_output_resolution;

    logger->info("Setting output resolution to {}x{}", output_resolution.x, output_resolution.y);

    destroy_render_targets();

    auto& allocator = RenderBackend::get().get_global_allocator();

    const auto eye_target = [&](const std::string& name, const VkFormat format) {
        return allocator.create_texture(
            name,
            {
                .format = format,
                .resolution = output_resolution,
                .usage = TextureUsage::RenderTarget,
                .num_layers = num_eye_views
            });
    };

    screen_color = eye_target("screen_color", blend_format);
    display_output = eye_target("display_output", output_format);
    history.set_textures(eye_target("history_0", blend_format), eye_target("history_1", blend_format));

    ambient_output = allocator.create_texture(
        "ambient_output",
        {.format = output_format, .resolution = output_resolution, .usage = TextureUsage::RenderTarget});
}

FrameSnapshot ScreenRenderer::build_snapshot(
    const AppConfig& config, const CameraArray& cameras, const uint64_t frame_index
) const {
    return build_frame_snapshot(
        config,
        cameras,
        screen_transform,
        ScreenSettings::get(),
        strategy,
        stereo_mode,
        output_resolution,
        frame_index);
}

void ScreenRenderer::render(const FrameSnapshot& snapshot, RenderGraph& graph) {
    ZoneScoped;

    const auto& settings = snapshot.settings;
    const auto plan = build_frame_plan(
        {
            .source_available = source_texture != nullptr,
            .flat_background_enabled = settings.flat_background_enabled,
            .ambient_enabled = settings.ambient_enabled,
            .history_read_slot = history.get_read_slot(),
            .history_write_slot = history.get_write_slot()
        });
    if(plan.empty()) {
        logger->debug("No source texture, skipping frame {}", snapshot.frame_index);
        return;
    }
    validate_frame_plan(plan);

    if(display_output == nullptr) {
        throw std::runtime_error{"Output resolution must be set before rendering"};
    }

    if(settings.mesh_resolution != screen_mesh_resolution) {
        rebuild_screen_mesh(settings.mesh_resolution);
    }

    const auto& frame_strategy = snapshot.strategy;
    const auto history_update = plan_history_update(plan, !history.needs_clear());

    auto& backend = RenderBackend::get();
    const auto& uniforms = frame_uniforms[backend.get_current_gpu_frame()];

    graph.begin_label("screen_renderer");

    graph.add_pass(
        {
            .name = "upload_frame_uniforms",
            .execute = [&](CommandBuffer& commands) {
                commands.update_buffer_immediate(uniforms.screen, snapshot.screen);
                commands.update_buffer_immediate(uniforms.cameras, snapshot.cameras);
                commands.update_buffer_immediate(uniforms.model, snapshot.model);
                commands.update_buffer_immediate(uniforms.temporal, snapshot.temporal);
            }
        });

    // The source was written outside of the graph
    graph.set_resource_usage(
        {
            .texture = source_texture,
            .stage = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT,
            .access = VK_ACCESS_2_MEMORY_WRITE_BIT,
            .layout = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL
        });

    if(history_update.clear_read_slot) {
        graph.add_clear_pass({.name = "clear_history", .image = history.get_read_texture()});
    }

    auto has_drawn_screen_color = false;
    for(const auto& pass : plan) {
        switch(pass.kind) {
        case PlannedPassKind::FlatBackground:
            {
                auto background_strategy = frame_strategy;
                background_strategy.geometry = ScreenGeometry::Flat;
                screen_phase.render(
                    graph,
                    uniforms,
                    background_strategy,
                    source_texture,
                    screen_color,
                    flat_mesh,
                    true);
                has_drawn_screen_color = true;
            }
            break;

        case PlannedPassKind::Screen:
            screen_phase.render(
                graph,
                uniforms,
                frame_strategy,
                source_texture,
                screen_color,
                frame_strategy.geometry == ScreenGeometry::Curved ? screen_mesh : flat_mesh,
                !has_drawn_screen_color);
            has_drawn_screen_color = true;
            break;

        case PlannedPassKind::TemporalBlend:
            temporal_blend_phase.render(
                graph,
                uniforms,
                screen_color,
                history.get_read_texture(),
                display_output,
                history.get_write_texture());
            break;

        case PlannedPassKind::Ambient:
            ambient_phase.render(graph, uniforms, display_output, ambient_output);
            break;
        }
    }

    graph.end_label();

    if(history_update.swap) {
        history.swap();
    }
}

void ScreenRenderer::set_ambient_enabled(const bool enabled) {
    ScreenSettings::set_ambient_enabled(enabled);
}

void ScreenRenderer::set_flat_background_enabled(const bool enabled) {
    ScreenSettings::set_flat_background_enabled(enabled);
}

void ScreenRenderer::set_strategy(const ScreenRenderStrategy& strategy_in) {
    strategy = strategy_in;
    ScreenSettings::set_stereo_mapping(strategy.mapping);
}

ScreenRenderStrategy ScreenRenderer::get_strategy() const {
    auto current = strategy;
    current.mapping = ScreenSettings::get().stereo_mapping;
    return current;
}

const ScreenTransform& ScreenRenderer::get_screen_transform() const {
    return screen_transform;
}

TextureHandle ScreenRenderer::get_display_output() const {
    return display_output;
}

TextureHandle ScreenRenderer::get_ambient_output() const {
    return ambient_output;
}

void ScreenRenderer::create_uniform_buffers() {
    auto& allocator = RenderBackend::get().get_global_allocator();

    for(auto frame_index = 0u; frame_index < frame_uniforms.size(); frame_index++) {
        auto& uniforms = frame_uniforms[frame_index];
        uniforms.screen = allocator.create_buffer(
            fmt::format("screen_params_{}", frame_index),
            sizeof(ScreenParams),
            BufferUsage::UniformBuffer);
        uniforms.cameras = allocator.create_buffer(
            fmt::format("cameras_{}", frame_index),
            sizeof(CameraUniform),
            BufferUsage::UniformBuffer);
        uniforms.model = allocator.create_buffer(
            fmt::format("screen_model_{}", frame_index),
            sizeof(ModelUniform),
            BufferUsage::UniformBuffer);
        uniforms.temporal = allocator.create_buffer(
            fmt::format("temporal_params_{}", frame_index),
            sizeof(TemporalBlurParams),
            BufferUsage::UniformBuffer);
    }
}

void ScreenRenderer::rebuild_screen_mesh(const uint32_t resolution) {
    destroy_mesh(screen_mesh);

    screen_mesh = upload_mesh(generate_plane_mesh(resolution, resolution, 1.f, 1.f, 0.f), "screen_mesh");
    screen_mesh_resolution = resolution;

    logger->debug("Built a {}x{} screen mesh", resolution, resolution);
}

void ScreenRenderer::rebuild_flat_mesh() {
    destroy_mesh(flat_mesh);

    // Same extent as the curved screen after its model transform
    const auto aspect_ratio = screen_transform.get_aspect_ratio();
    flat_mesh = upload_mesh(
        generate_plane_mesh(
            2,
            2,
            aspect_ratio,
            screen_transform.get_scale() / (2.f * aspect_ratio),
            -screen_transform.get_distance()),
        "flat_mesh");
}

void ScreenRenderer::destroy_render_targets() {
    auto& allocator = RenderBackend::get().get_global_allocator();

    for(auto* texture : {screen_color, display_output, ambient_output}) {
        if(texture != nullptr) {
            allocator.destroy_texture(texture);
        }
    }
    if(display_output != nullptr) {
        allocator.destroy_texture(history.get_read_texture());
        allocator.destroy_texture(history.get_write_texture());
    }

    screen_color = nullptr;
    display_output = nullptr;
    ambient_output = nullptr;
}

ScreenMeshBuffers ScreenRenderer::upload_mesh(const PlaneMesh& mesh, const std::string& name) {
    auto& allocator = RenderBackend::get().get_global_allocator();

    const auto vertex_data_size = mesh.vertices.size() * sizeof(ScreenVertex);
    const auto index_data_size = mesh.indices.size() * sizeof(uint32_t);

    const auto buffers = ScreenMeshBuffers{
        .vertices = allocator.create_buffer(
            fmt::format("{}_vertices", name),
            vertex_data_size,
            BufferUsage::VertexBuffer),
        .indices = allocator.create_buffer(fmt::format("{}_indices", name), index_data_size, BufferUsage::IndexBuffer),
        .num_indices = static_cast<uint32_t>(mesh.indices.size())
    };

    std::memcpy(allocator.map_buffer(buffers.vertices), mesh.vertices.data(), vertex_data_size);
    std::memcpy(allocator.map_buffer(buffers.indices), mesh.indices.data(), index_data_size);

    for(const auto buffer : {buffers.vertices, buffers.indices}) {
        const auto result = vmaFlushAllocation(allocator.get_vma(), buffer->allocation, 0, VK_WHOLE_SIZE);
        if(result != VK_SUCCESS) {
            throw std::runtime_error{
                fmt::format("Could not flush mesh buffer {}: {}", buffer->name, string_VkResult(result))
            };
        }
    }

    return buffers;
}

void ScreenRenderer::destroy_mesh(ScreenMeshBuffers& mesh) {
    if(mesh.vertices == nullptr) {
        return;
    }

    auto& allocator = RenderBackend::get().get_global_allocator();
    allocator.destroy_buffer(mesh.vertices);
    allocator.destroy_buffer(mesh.indices);

    mesh = {};
}
