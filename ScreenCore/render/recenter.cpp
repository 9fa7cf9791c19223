#include "recenter.hpp"

#include <cmath>

glm::quat compute_recenter_orientation(const glm::quat& view_orientation, const bool horizon_locked) {
    const auto look = view_orientation * glm::vec3{0.f, 0.f, 1.f};

    const auto yaw = std::atan2(look.x, look.z);
    const auto yaw_rotation = glm::angleAxis(yaw, glm::vec3{0.f, 1.f, 0.f});
    if(horizon_locked) {
        return yaw_rotation;
    }

    const auto pitch = -std::atan2(look.y, std::sqrt(look.x * look.x + look.z * look.z));
    return yaw_rotation * glm::angleAxis(pitch, glm::vec3{1.f, 0.f, 0.f});
}
