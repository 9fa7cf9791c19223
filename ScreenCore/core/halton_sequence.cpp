#include "halton_sequence.hpp"

float halton(uint32_t index, const uint32_t base) {
    auto f = 1.f;
    auto r = 0.f;
    while(index > 0) {
        f /= static_cast<float>(base);
        r += f * static_cast<float>(index % base);
        index /= base;
    }
    return r;
}

glm::vec2 get_jitter(const uint32_t jitter_index, const glm::vec2 resolution) {
    const auto jitter = glm::vec2{
        2.f * halton(jitter_index, 2) - 1.f,
        2.f * halton(jitter_index, 3) - 1.f
    };

    return jitter / resolution;
}
