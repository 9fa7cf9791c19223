#pragma once

#include <cstdint>
#include <string>

enum class ScreenGeometry {
    /**
     * Plain quad, no curvature applied
     */
    Flat,

    /**
     * Grid mesh pushed away from the viewer by the curvature terms
     */
    Curved,
};

enum class ViewMode {
    /**
     * Each view samples its own half of a side-by-side source
     */
    Stereo,

    /**
     * Every view samples as if it were view 0
     */
    Mono,
};

enum class StereoMapping {
    Symmetric,

    /**
     * Direct halving, without eye swap or mirroring
     */
    Legacy,
};

/**
 * Which variant of the screen draw to record
 *
 * The variants share one pass. They differ only in the shader permutation that gets bound
 */
struct ScreenRenderStrategy {
    ScreenGeometry geometry = ScreenGeometry::Curved;

    ViewMode view_mode = ViewMode::Stereo;

    StereoMapping mapping = StereoMapping::Symmetric;

    bool operator==(const ScreenRenderStrategy& other) const = default;

    std::string get_vertex_shader_path() const;

    std::string get_fragment_shader_path() const;

    /**
     * Index of this variant in [0, num_variants). The screen phase keeps one pipeline per index
     *
     * Throws std::out_of_range if a member isn't one of its enum's values
     */
    uint32_t get_variant_index() const;

    static constexpr uint32_t num_variants = 8;

    static ScreenRenderStrategy from_variant_index(uint32_t index);
};
