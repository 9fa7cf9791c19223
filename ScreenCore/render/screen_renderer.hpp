#pragma once

#include <array>
#include <cstdint>
#include <string>

#include <glm/vec2.hpp>

#include "core/stereo_mode.hpp"
#include "render/frame_snapshot.hpp"
#include "render/frame_uniforms.hpp"
#include "render/history_buffer.hpp"
#include "render/screen_render_strategy.hpp"
#include "render/screen_transform.hpp"
#include "render/backend/constants.hpp"
#include "render/phase/ambient_phase.hpp"
#include "render/phase/screen_phase.hpp"
#include "render/phase/temporal_blend_phase.hpp"

struct AppConfig;
struct PlaneMesh;
class CameraArray;
class RenderGraph;

/**
 * Renders the virtual screen for both eyes
 *
 * Owns the screen meshes, the per-frame uniform buffers, the render targets, and the temporal history. Each frame:
 * - The screen (and optionally a flat background) is drawn into a two-layer image, one layer per eye
 * - The temporal blend mixes that image with last frame's history, producing the displayed image and the new history
 * - The ambient pass blurs the left eye of the displayed image into a dim glow for the space around the screen
 *
 * The RenderBackend must exist for as long as this object does
 */
class ScreenRenderer {
public:
    explicit ScreenRenderer(const AppConfig& config);

    /**
     * Moves and resizes the screen to match the config
     */
    void apply_config(const AppConfig& config);

    /**
     * Sets the video frame to put on the screen
     *
     * The texture must be in SHADER_READ_ONLY_OPTIMAL whenever a frame's graph runs. Recomputes the screen's aspect
     * ratio, which for side-by-side frames is the aspect ratio of one half
     */
    void set_source_texture(TextureHandle source, glm::uvec2 source_resolution, StereoMode stereo_mode_in);

    /**
     * Recreates the render targets at the new resolution, if it changed. The history is cleared the next frame
     */
    void set_output_resolution(glm::uvec2 new_output_resolution);

    /**
     * Gathers this frame's uniforms from the config, the eye cameras, and the screen cvars
     */
    FrameSnapshot build_snapshot(const AppConfig& config, const CameraArray& cameras, uint64_t frame_index) const;

    /**
     * Records the frame into the graph
     *
     * Does nothing if there's no source texture yet. Throws if set_output_resolution hasn't been called
     */
    void render(const FrameSnapshot& snapshot, RenderGraph& graph);

    void set_ambient_enabled(bool enabled);

    void set_flat_background_enabled(bool enabled);

    /**
     * Picks the screen geometry and view mode. The stereo mapping is stored in r.Screen.StereoMapping
     */
    void set_strategy(const ScreenRenderStrategy& strategy_in);

    ScreenRenderStrategy get_strategy() const;

    const ScreenTransform& get_screen_transform() const;

    /**
     * Blended two-layer image to present, one layer per eye
     */
    TextureHandle get_display_output() const;

    TextureHandle get_ambient_output() const;

private:
    ScreenPhase screen_phase;

    TemporalBlendPhase temporal_blend_phase;

    AmbientPhase ambient_phase;

    ScreenRenderStrategy strategy = {};

    ScreenTransform screen_transform;

    StereoMode stereo_mode = StereoMode::SideBySide;

    TextureHandle source_texture = nullptr;

    glm::uvec2 output_resolution = {};

    std::array<FrameUniforms, num_in_flight_frames> frame_uniforms = {};

    /**
     * Grid that the vertex shader bends. Spans [-1, 1], the model matrix places it
     */
    ScreenMeshBuffers screen_mesh = {};

    uint32_t screen_mesh_resolution = 0;

    /**
     * Quad already in world space, at the screen's distance and size. Used for flat screens and the flat background
     */
    ScreenMeshBuffers flat_mesh = {};

    TextureHandle screen_color = nullptr;

    TextureHandle display_output = nullptr;

    TextureHandle ambient_output = nullptr;

    HistoryBuffer history;

    void create_uniform_buffers();

    void rebuild_screen_mesh(uint32_t resolution);

    void rebuild_flat_mesh();

    void destroy_render_targets();

    static ScreenMeshBuffers upload_mesh(const PlaneMesh& mesh, const std::string& name);

    static void destroy_mesh(ScreenMeshBuffers& mesh);
};
