#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <vector>

#include <glm/glm.hpp>

/**
 * Tiny RGB image with clamp-to-edge bilinear sampling, matching the default sampler the passes use
 */
class CpuImage {
public:
    CpuImage(const uint32_t width_in, const uint32_t height_in, const glm::vec3& fill) :
        width{width_in}, height{height_in}, texels(width_in * height_in, fill) {}

    void set(const uint32_t x, const uint32_t y, const glm::vec3& color) {
        texels[y * width + x] = color;
    }

    glm::vec3 fetch(const int32_t x, const int32_t y) const {
        const auto clamped_x = std::clamp(x, 0, static_cast<int32_t>(width) - 1);
        const auto clamped_y = std::clamp(y, 0, static_cast<int32_t>(height) - 1);
        return texels[clamped_y * width + clamped_x];
    }

    glm::vec3 sample(const glm::vec2& uv) const {
        const auto texel = uv * glm::vec2{width, height} - 0.5f;
        const auto base = glm::floor(texel);
        const auto fraction = texel - base;
        const auto x = static_cast<int32_t>(base.x);
        const auto y = static_cast<int32_t>(base.y);

        const auto top = glm::mix(fetch(x, y), fetch(x + 1, y), fraction.x);
        const auto bottom = glm::mix(fetch(x, y + 1), fetch(x + 1, y + 1), fraction.x);
        return glm::mix(top, bottom, fraction.y);
    }

private:
    uint32_t width;

    uint32_t height;

    std::vector<glm::vec3> texels;
};
