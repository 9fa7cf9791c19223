#include "stereo_mode.hpp"

#include <stdexcept>

float get_eye_aspect_ratio(const glm::uvec2 source_resolution, const StereoMode mode) {
    if(source_resolution.x == 0 || source_resolution.y == 0) {
        throw std::invalid_argument{"Source resolution must not be zero"};
    }

    const auto width = static_cast<float>(source_resolution.x);
    const auto height = static_cast<float>(source_resolution.y);
    if(mode == StereoMode::SideBySide) {
        return (width / 2.f) / height;
    }

    return width / height;
}
