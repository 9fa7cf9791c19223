#include <stdexcept>

#include <gtest/gtest.h>

#include "core/stereo_mode.hpp"

TEST(StereoMode, SideBySideHalvesTheWidth) {
    EXPECT_FLOAT_EQ(get_eye_aspect_ratio({3840, 1080}, StereoMode::SideBySide), 1920.f / 1080.f);
}

TEST(StereoMode, MonoUsesTheWholeFrame) {
    EXPECT_FLOAT_EQ(get_eye_aspect_ratio({1920, 1080}, StereoMode::Mono), 1920.f / 1080.f);
}

TEST(StereoMode, EmptySourceThrows) {
    EXPECT_THROW(get_eye_aspect_ratio({0, 1080}, StereoMode::Mono), std::invalid_argument);
    EXPECT_THROW(get_eye_aspect_ratio({3840, 0}, StereoMode::SideBySide), std::invalid_argument);
}
