#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

/**
 * Orientation of a reference space that puts the screen straight ahead of where the viewer is looking
 *
 * With horizon_locked the space only turns around the vertical axis, so the screen stays level. Otherwise it also
 * pitches to follow the viewer's gaze
 */
glm::quat compute_recenter_orientation(const glm::quat& view_orientation, bool horizon_locked);
