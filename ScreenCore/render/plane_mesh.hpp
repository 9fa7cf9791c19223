#pragma once

#include <cstdint>

#include <EASTL/vector.h>

#include "shared/screen_vertex.hpp"

/**
 * CPU-side triangle list for the screen
 */
struct PlaneMesh {
    eastl::vector<ScreenVertex> vertices;

    eastl::vector<uint32_t> indices;
};

/**
 * Generates a rows x columns grid of vertices on the XY plane, spanning [-scale * aspect_ratio, scale * aspect_ratio]
 * horizontally and [-scale, scale] vertically
 *
 * Texcoords go from (0, 1) at the bottom left to (1, 0) at the top right. The grid needs enough vertices to
 * curve smoothly, a plain quad would only bend at its corners
 *
 * Throws std::invalid_argument if either dimension has fewer than two vertices
 */
PlaneMesh generate_plane_mesh(uint32_t rows, uint32_t columns, float aspect_ratio, float scale, float depth);
