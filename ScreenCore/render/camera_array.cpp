#include "camera_array.hpp"

#include <cmath>
#include <stdexcept>

#include <spdlog/fmt/fmt.h>
#include <glm/ext/matrix_transform.hpp>

const glm::mat4 CameraArray::vulkan_clip_correction = glm::scale(glm::mat4{1.f}, glm::vec3{1.f, -1.f, 1.f});

void EyeCamera::set_pose(const glm::vec3& position_in, const glm::quat& orientation_in) {
    position = position_in;
    orientation = orientation_in;

    world_matrix = glm::translate(glm::mat4{1.f}, position) * glm::mat4_cast(orientation);
}

void EyeCamera::set_projection_from_fov(const EyeFov& fov) {
    const auto tan_right = std::tan(fov.angle_right);
    const auto tan_left = std::tan(fov.angle_left);
    const auto tan_up = std::tan(fov.angle_up);
    const auto tan_down = std::tan(fov.angle_down);
    const auto tan_width = tan_right - tan_left;
    const auto tan_height = tan_up - tan_down;

    projection = glm::mat4{0.f};
    projection[0][0] = 2.f / tan_width;
    projection[1][1] = 2.f / tan_height;
    projection[2][0] = (tan_right + tan_left) / tan_width;
    projection[2][1] = (tan_up + tan_down) / tan_height;
    projection[2][2] = -1.f;
    projection[2][3] = -1.f;
    projection[3][2] = -near_plane;
}

const glm::mat4& EyeCamera::get_world_matrix() const {
    return world_matrix;
}

const glm::mat4& EyeCamera::get_projection() const {
    return projection;
}

glm::mat4 EyeCamera::build_view_projection() const {
    const auto determinant = glm::determinant(world_matrix);
    if(std::abs(determinant) < 1e-8f || !std::isfinite(determinant)) {
        throw std::runtime_error{"Provided world matrix is not invertible"};
    }

    return projection * glm::inverse(world_matrix);
}

void CameraArray::update(const std::span<const EyeView> views) {
    if(views.size() != eyes.size()) {
        throw std::invalid_argument{fmt::format("Expected {} eye views, got {}", eyes.size(), views.size())};
    }

    auto failed_eye = -1;
    for(auto view_index = 0u; view_index < eyes.size(); view_index++) {
        const auto& view = views[view_index];
        auto& eye = eyes[view_index];
        eye.set_pose(view.position, view.orientation);
        eye.set_projection_from_fov(view.fov);

        try {
            gpu_data.view_proj[view_index] = vulkan_clip_correction * eye.build_view_projection();
        } catch(const std::runtime_error&) {
            failed_eye = static_cast<int>(view_index);
        }
    }

    if(failed_eye >= 0) {
        throw std::runtime_error{fmt::format("Could not build the view-projection matrix of eye {}", failed_eye)};
    }
}

const EyeCamera& CameraArray::get_eye(const uint32_t view_index) const {
    return eyes.at(view_index);
}

const CameraUniform& CameraArray::get_gpu_data() const {
    return gpu_data;
}
