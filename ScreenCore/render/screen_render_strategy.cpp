#include "screen_render_strategy.hpp"

#include <stdexcept>

#include <magic_enum.hpp>
#include <spdlog/fmt/fmt.h>

std::string ScreenRenderStrategy::get_vertex_shader_path() const {
    if(geometry == ScreenGeometry::Curved) {
        return "shaders/screen_curved.vert.spv";
    }
    return "shaders/screen_flat.vert.spv";
}

std::string ScreenRenderStrategy::get_fragment_shader_path() const {
    const auto* mapping_name = mapping == StereoMapping::Symmetric ? "symmetric" : "legacy";
    const auto* view_name = view_mode == ViewMode::Stereo ? "stereo" : "mono";
    return fmt::format("shaders/screen_{}_{}.frag.spv", mapping_name, view_name);
}

uint32_t ScreenRenderStrategy::get_variant_index() const {
    if(!magic_enum::enum_contains(geometry) || !magic_enum::enum_contains(view_mode) ||
       !magic_enum::enum_contains(mapping)) {
        throw std::out_of_range{
            fmt::format(
                "No screen variant for geometry {}, view mode {}, mapping {}",
                static_cast<int32_t>(geometry),
                static_cast<int32_t>(view_mode),
                static_cast<int32_t>(mapping))
        };
    }

    return static_cast<uint32_t>(geometry) * 4 + static_cast<uint32_t>(view_mode) * 2 + static_cast<uint32_t>(mapping);
}

ScreenRenderStrategy ScreenRenderStrategy::from_variant_index(const uint32_t index) {
    if(index >= num_variants) {
        throw std::out_of_range{fmt::format("No screen variant {}", index)};
    }

    return ScreenRenderStrategy{
        .geometry = static_cast<ScreenGeometry>(index / 4),
        .view_mode = static_cast<ViewMode>((index / 2) % 2),
        .mapping = static_cast<StereoMapping>(index % 2),
    };
}
