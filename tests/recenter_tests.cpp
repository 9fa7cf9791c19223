#include <gtest/gtest.h>

#include <glm/gtc/constants.hpp>

#include "render/recenter.hpp"

static constexpr auto forward = glm::vec3{0.f, 0.f, 1.f};

static void expect_vec3_near(const glm::vec3& actual, const glm::vec3& expected) {
    EXPECT_NEAR(actual.x, expected.x, 1e-5f);
    EXPECT_NEAR(actual.y, expected.y, 1e-5f);
    EXPECT_NEAR(actual.z, expected.z, 1e-5f);
}

TEST(Recenter, IdentityStaysIdentity) {
    const auto identity = glm::quat{1.f, 0.f, 0.f, 0.f};

    expect_vec3_near(compute_recenter_orientation(identity, true) * forward, forward);
    expect_vec3_near(compute_recenter_orientation(identity, false) * forward, forward);
}

TEST(Recenter, FollowsYaw) {
    const auto view = glm::angleAxis(glm::half_pi<float>(), glm::vec3{0.f, 1.f, 0.f});

    const auto recentered = compute_recenter_orientation(view, true);

    expect_vec3_near(recentered * forward, glm::vec3{1.f, 0.f, 0.f});
}

TEST(Recenter, HorizonLockIgnoresPitch) {
    const auto yaw = glm::angleAxis(0.6f, glm::vec3{0.f, 1.f, 0.f});
    const auto view = yaw * glm::angleAxis(0.3f, glm::vec3{1.f, 0.f, 0.f});

    const auto recentered = compute_recenter_orientation(view, true);

    const auto recentered_forward = recentered * forward;
    EXPECT_NEAR(recentered_forward.y, 0.f, 1e-5f);
    expect_vec3_near(recentered_forward, yaw * forward);
}

TEST(Recenter, UnlockedFollowsPitch) {
    const auto view = glm::angleAxis(0.6f, glm::vec3{0.f, 1.f, 0.f}) *
                      glm::angleAxis(0.3f, glm::vec3{1.f, 0.f, 0.f});

    const auto recentered = compute_recenter_orientation(view, false);

    expect_vec3_near(recentered * forward, view * forward);
}

TEST(Recenter, RollIsDropped) {
    const auto view = glm::angleAxis(0.8f, glm::vec3{0.f, 0.f, 1.f});

    const auto recentered = compute_recenter_orientation(view, false);

    expect_vec3_near(recentered * glm::vec3{0.f, 1.f, 0.f}, glm::vec3{0.f, 1.f, 0.f});
    expect_vec3_near(recentered * forward, forward);
}
