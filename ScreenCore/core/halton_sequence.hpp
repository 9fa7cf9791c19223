#pragma once

#include <cstdint>

#include <glm/vec2.hpp>

/**
 * Evaluates the radical inverse of index in the given base
 */
float halton(uint32_t index, uint32_t base);

/**
 * Sub-pixel jitter from the (2, 3) Halton sequence, in UV units
 *
 * Each component is in [-1/resolution, 1/resolution)
 */
glm::vec2 get_jitter(uint32_t jitter_index, glm::vec2 resolution);
