#pragma once

#include <array>
#include <span>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#include "shared/camera_data.hpp"

/**
 * Field of view of one eye, as the angles of the four frustum edges. Left and down are negative for a centered eye
 */
struct EyeFov {
    float angle_left = -0.785398f;
    float angle_right = 0.785398f;
    float angle_up = 0.785398f;
    float angle_down = -0.785398f;
};

/**
 * Pose and field of view of one eye, as located by the XR runtime for the predicted display time
 */
struct EyeView {
    glm::vec3 position = glm::vec3{0};

    glm::quat orientation = glm::quat{1.f, 0.f, 0.f, 0.f};

    EyeFov fov = {};
};

/**
 * One eye of the headset
 */
class EyeCamera {
public:
    static constexpr float near_plane = 0.1f;

    void set_pose(const glm::vec3& position_in, const glm::quat& orientation_in);

    /**
     * Builds an asymmetric projection from the tangents of the frustum edges
     *
     * The far plane is at infinity. Depth is 0 at the near plane and approaches 1 as distance grows
     */
    void set_projection_from_fov(const EyeFov& fov);

    const glm::mat4& get_world_matrix() const;

    const glm::mat4& get_projection() const;

    /**
     * Computes projection * inverse(world)
     *
     * Throws std::runtime_error if the world matrix can't be inverted
     */
    glm::mat4 build_view_projection() const;

private:
    glm::vec3 position = glm::vec3{0};

    glm::quat orientation = glm::quat{1.f, 0.f, 0.f, 0.f};

    glm::mat4 world_matrix = glm::mat4{1.f};

    glm::mat4 projection = glm::mat4{1.f};
};

/**
 * The two eye cameras of a multiview draw. The vertex shaders pick an entry with gl_ViewIndex
 */
class CameraArray {
public:
    /**
     * Converts from the camera's clip space, which has Y up, to Vulkan's, which has Y down
     */
    static const glm::mat4 vulkan_clip_correction;

    /**
     * Updates both eyes from the views located this frame
     *
     * Throws std::invalid_argument unless there's exactly one view per eye. If an eye's view-projection can't be built,
     * that eye keeps last frame's matrix and std::runtime_error is thrown after the other eye has been updated
     */
    void update(std::span<const EyeView> views);

    const EyeCamera& get_eye(uint32_t view_index) const;

    /**
     * View-projection matrices in the layout the shaders read, with the clip-space correction applied
     */
    const CameraUniform& get_gpu_data() const;

private:
    std::array<EyeCamera, NUM_EYE_VIEWS> eyes = {};

    CameraUniform gpu_data = {
        .view_proj = {glm::mat4{1.f}, glm::mat4{1.f}}
    };
};
