#include "screen_transform.hpp"

#include <stdexcept>

#include <glm/ext/matrix_transform.hpp>

ScreenTransform::ScreenTransform(const float distance_in, const float scale_in, const float aspect_ratio_in) :
    distance{distance_in}, scale{scale_in}, aspect_ratio{aspect_ratio_in} {
    if(aspect_ratio <= 0) {
        throw std::invalid_argument{"Screen aspect ratio must be positive"};
    }

    update_matrix();
}

void ScreenTransform::change_aspect_ratio(const float aspect_ratio_in) {
    if(aspect_ratio_in <= 0) {
        throw std::invalid_argument{"Screen aspect ratio must be positive"};
    }

    aspect_ratio = aspect_ratio_in;
    update_matrix();
}

void ScreenTransform::change_scale(const float scale_in) {
    scale = scale_in;
    update_matrix();
}

void ScreenTransform::change_distance(const float distance_in) {
    distance = distance_in;
    update_matrix();
}

float ScreenTransform::get_aspect_ratio() const {
    return aspect_ratio;
}

float ScreenTransform::get_scale() const {
    return scale;
}

float ScreenTransform::get_distance() const {
    return distance;
}

glm::vec3 ScreenTransform::get_position() const {
    return glm::vec3{0.f, 0.f, -distance};
}

glm::vec3 ScreenTransform::get_scale_vector() const {
    return glm::vec3{scale / 2.f, scale / (2.f * aspect_ratio), scale / 2.f};
}

const glm::mat4& ScreenTransform::get_model_matrix() const {
    return model_matrix;
}

ModelUniform ScreenTransform::get_gpu_data() const {
    return ModelUniform{.model = model_matrix};
}

void ScreenTransform::update_matrix() {
    model_matrix = glm::translate(glm::mat4{1.f}, get_position()) *
        glm::mat4_cast(rotation) *
        glm::scale(glm::mat4{1.f}, get_scale_vector());
}
