#include "plane_mesh.hpp"

#include <stdexcept>

#include <spdlog/fmt/fmt.h>

PlaneMesh generate_plane_mesh(
    const uint32_t rows, const uint32_t columns, const float aspect_ratio, const float scale, const float depth
) {
    if(rows < 2 || columns < 2) {
        throw std::invalid_argument{fmt::format("Plane mesh needs at least 2x2 vertices, got {}x{}", rows, columns)};
    }

    auto mesh = PlaneMesh{};
    mesh.vertices.reserve(rows * columns);
    mesh.indices.reserve((rows - 1) * (columns - 1) * 6);

    const auto x_increment = 2.f / static_cast<float>(columns - 1);
    const auto y_increment = 2.f / static_cast<float>(rows - 1);
    for(auto row = 0u; row < rows; row++) {
        for(auto column = 0u; column < columns; column++) {
            mesh.vertices.push_back(
                ScreenVertex{
                    .position = {
                        (-1.f + static_cast<float>(column) * x_increment) * scale * aspect_ratio,
                        (-1.f + static_cast<float>(row) * y_increment) * scale,
                        depth
                    },
                    .texcoord = {
                        static_cast<float>(column) / static_cast<float>(columns - 1),
                        1.f - static_cast<float>(row) / static_cast<float>(rows - 1)
                    }
                }
            );
        }
    }

    for(auto row = 0u; row < rows - 1; row++) {
        for(auto column = 0u; column < columns - 1; column++) {
            const auto bottom_left = row * columns + column;
            const auto top_left = (row + 1) * columns + column;
            mesh.indices.push_back(bottom_left);
            mesh.indices.push_back(bottom_left + 1);
            mesh.indices.push_back(top_left);
            mesh.indices.push_back(top_left);
            mesh.indices.push_back(bottom_left + 1);
            mesh.indices.push_back(top_left + 1);
        }
    }

    return mesh;
}
