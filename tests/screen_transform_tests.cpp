#include <stdexcept>

#include <gtest/gtest.h>

#include "render/screen_transform.hpp"

TEST(ScreenTransform, PlacesTheScreenInFrontOfTheViewer) {
    const auto transform = ScreenTransform{20.f, 40.f, 2.f};

    EXPECT_EQ(transform.get_position(), glm::vec3(0.f, 0.f, -20.f));
    EXPECT_EQ(transform.get_scale_vector(), glm::vec3(20.f, 10.f, 20.f));
}

TEST(ScreenTransform, MapsMeshCornersToTheScreenEdges) {
    const auto transform = ScreenTransform{20.f, 40.f, 16.f / 9.f};

    const auto top_right = transform.get_model_matrix() * glm::vec4{1.f, 1.f, 0.f, 1.f};
    EXPECT_NEAR(top_right.x, 20.f, 1e-4f);
    EXPECT_NEAR(top_right.y, 20.f * 9.f / 16.f, 1e-4f);
    EXPECT_NEAR(top_right.z, -20.f, 1e-4f);

    const auto bottom_left = transform.get_model_matrix() * glm::vec4{-1.f, -1.f, 0.f, 1.f};
    EXPECT_NEAR(bottom_left.x, -20.f, 1e-4f);
    EXPECT_NEAR(bottom_left.y, -20.f * 9.f / 16.f, 1e-4f);
}

TEST(ScreenTransform, ChangesRebuildTheMatrix) {
    auto transform = ScreenTransform{20.f, 40.f, 1.f};

    transform.change_distance(5.f);
    transform.change_scale(10.f);
    transform.change_aspect_ratio(2.f);

    const auto corner = transform.get_model_matrix() * glm::vec4{1.f, 1.f, 0.f, 1.f};
    EXPECT_NEAR(corner.x, 5.f, 1e-5f);
    EXPECT_NEAR(corner.y, 2.5f, 1e-5f);
    EXPECT_NEAR(corner.z, -5.f, 1e-5f);

    EXPECT_EQ(transform.get_gpu_data().model, transform.get_model_matrix());
}

TEST(ScreenTransform, RejectsNonPositiveAspectRatios) {
    EXPECT_THROW((ScreenTransform{20.f, 40.f, 0.f}), std::invalid_argument);

    auto transform = ScreenTransform{20.f, 40.f, 1.f};
    EXPECT_THROW(transform.change_aspect_ratio(-1.f), std::invalid_argument);
    EXPECT_EQ(transform.get_aspect_ratio(), 1.f);
}
