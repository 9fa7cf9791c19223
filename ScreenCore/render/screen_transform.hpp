#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#include "shared/camera_data.hpp"

/**
 * Placement of the virtual screen in front of the viewer
 *
 * The screen mesh spans [-1, 1] on both axes, so a scale of N makes the screen N units wide. Its height follows from
 * the aspect ratio of the source
 */
class ScreenTransform {
public:
    ScreenTransform(float distance_in, float scale_in, float aspect_ratio_in);

    void change_aspect_ratio(float aspect_ratio_in);

    void change_scale(float scale_in);

    /**
     * Moves the screen to the given distance in front of the viewer
     */
    void change_distance(float distance_in);

    float get_aspect_ratio() const;

    float get_scale() const;

    float get_distance() const;

    glm::vec3 get_position() const;

    glm::vec3 get_scale_vector() const;

    const glm::mat4& get_model_matrix() const;

    ModelUniform get_gpu_data() const;

private:
    float distance;

    float scale;

    float aspect_ratio;

    glm::quat rotation = glm::quat{1.f, 0.f, 0.f, 0.f};

    glm::mat4 model_matrix = glm::mat4{1.f};

    void update_matrix();
};
