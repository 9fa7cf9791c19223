#include <gtest/gtest.h>

#include "cvar_test_fixture.hpp"
#include "temp_file.hpp"
#include "core/app_config.hpp"
#include "render/screen_settings.hpp"

TEST(AppConfig, Defaults) {
    const auto config = AppConfig{};

    EXPECT_FLOAT_EQ(config.x_curvature, 0.4f);
    EXPECT_FLOAT_EQ(config.y_curvature, 0.08f);
    EXPECT_TRUE(config.swap_eyes);
    EXPECT_FALSE(config.flip_x);
    EXPECT_FALSE(config.flip_y);
    EXPECT_FLOAT_EQ(config.distance, 20.f);
    EXPECT_FLOAT_EQ(config.scale, 40.f);
    EXPECT_FALSE(config.config_file.has_value());
}

TEST(AppConfig, EmptyObjectKeepsDefaults) {
    const auto config = AppConfig::parse("{}");

    EXPECT_FLOAT_EQ(config.x_curvature, 0.4f);
    EXPECT_TRUE(config.swap_eyes);
    EXPECT_FLOAT_EQ(config.scale, 40.f);
}

TEST(AppConfig, ParsesEveryField) {
    const auto config = AppConfig::parse(
        R"({
            "x_curvature": 0.1,
            "y_curvature": 0,
            "swap_eyes": false,
            "flip_x": true,
            "flip_y": true,
            "distance": 12.5,
            "scale": 30
        })");

    EXPECT_FLOAT_EQ(config.x_curvature, 0.1f);
    EXPECT_FLOAT_EQ(config.y_curvature, 0.f);
    EXPECT_FALSE(config.swap_eyes);
    EXPECT_TRUE(config.flip_x);
    EXPECT_TRUE(config.flip_y);
    EXPECT_FLOAT_EQ(config.distance, 12.5f);
    EXPECT_FLOAT_EQ(config.scale, 30.f);
}

TEST(AppConfig, MalformedJsonThrows) {
    EXPECT_THROW(AppConfig::parse("{\"scale\": "), ConfigParseException);
    EXPECT_THROW(AppConfig::parse("[1, 2, 3]"), ConfigParseException);
    EXPECT_THROW(AppConfig::parse(""), ConfigParseException);
}

TEST(AppConfig, WrongTypesThrow) {
    EXPECT_THROW(AppConfig::parse(R"({"scale": "big"})"), ConfigParseException);
    EXPECT_THROW(AppConfig::parse(R"({"swap_eyes": 1})"), ConfigParseException);
    EXPECT_THROW(AppConfig::parse(R"({"cvars": 3})"), ConfigParseException);
}

TEST_F(ScreenCvarTest, ConfigCvarsOverrideConsoleVariables) {
    AppConfig::parse(
        R"({
            "cvars": {
                "r.Screen.HistoryDecay": 0.75,
                "r.Screen.Ambient.Enable": false,
                "r.Screen.StereoMapping": "Legacy"
            }
        })");

    const auto settings = ScreenSettings::get();
    EXPECT_FLOAT_EQ(settings.history_decay, 0.75f);
    EXPECT_FALSE(settings.ambient_enabled);
    EXPECT_EQ(settings.stereo_mapping, StereoMapping::Legacy);
}

TEST_F(ScreenCvarTest, UnknownConfigCvarsThrow) {
    EXPECT_THROW(AppConfig::parse(R"({"cvars": {"r.Screen.Nope": 1}})"), ConfigParseException);
    EXPECT_THROW(AppConfig::parse(R"({"cvars": {"r.Screen.HistoryDecay": [1]}})"), ConfigParseException);
}

TEST_F(ScreenCvarTest, InvalidConfigCvarValuesThrow) {
    EXPECT_THROW(AppConfig::parse(R"({"cvars": {"r.Screen.StereoMapping": 5}})"), ConfigParseException);
    EXPECT_THROW(AppConfig::parse(R"({"cvars": {"r.Screen.StereoMapping": "Sideways"}})"), ConfigParseException);
    EXPECT_THROW(AppConfig::parse(R"({"cvars": {"r.Screen.MeshResolution": 1e12}})"), ConfigParseException);
    EXPECT_THROW(AppConfig::parse(R"({"cvars": {"r.Screen.MeshResolution": 64.5}})"), ConfigParseException);

    const auto settings = ScreenSettings::get();
    EXPECT_EQ(settings.stereo_mapping, StereoMapping::Symmetric);
    EXPECT_EQ(settings.mesh_resolution, 100u);
}

TEST(AppConfig, LoadsFromFile) {
    const auto file = TempFile{".json"};
    file.write(R"({"distance": 8, "flip_y": true})");

    const auto config = AppConfig::load_from_file(file.get_path());

    EXPECT_FLOAT_EQ(config.distance, 8.f);
    EXPECT_TRUE(config.flip_y);
    ASSERT_TRUE(config.config_file.has_value());
    EXPECT_EQ(*config.config_file, file.get_path());
}

TEST(AppConfig, MissingFileThrows) {
    EXPECT_THROW(
        AppConfig::load_from_file(std::filesystem::temp_directory_path() / "no_such_screen_config.json"),
        ConfigParseException);
}

TEST(AppConfig, EncodesScreenParams) {
    auto config = AppConfig{};
    config.flip_y = true;

    const auto params = config.to_screen_params(1.5f, StereoMode::SideBySide, 2048, 128);

    EXPECT_FLOAT_EQ(params.x_curvature, 0.4f);
    EXPECT_FLOAT_EQ(params.y_curvature, 0.08f);
    EXPECT_EQ(params.eye_offset, 1.f);
    EXPECT_EQ(params.x_offset, 0.f);
    EXPECT_EQ(params.y_offset, 1.f);
    EXPECT_EQ(params.aspect_ratio, 1.5f);
    EXPECT_EQ(params.screen_width, 2048u);
    EXPECT_EQ(params.ambient_width, 128u);
    EXPECT_EQ(params.stereo_x, 1.f);
    EXPECT_EQ(params.stereo_y, 0.f);

    EXPECT_EQ(config.to_screen_params(1.5f, StereoMode::Mono, 2048, 128).stereo_x, 0.f);
}

TEST(AppConfig, FlippingXSwapsEyesOnlyForSideBySide) {
    auto config = AppConfig{};

    config.toggle_flip_x(StereoMode::SideBySide);
    EXPECT_TRUE(config.flip_x);
    EXPECT_FALSE(config.swap_eyes);

    config.toggle_flip_x(StereoMode::Mono);
    EXPECT_FALSE(config.flip_x);
    EXPECT_FALSE(config.swap_eyes);
}

TEST(AppConfig, FlippingYNeverSwapsEyes) {
    auto config = AppConfig{};

    config.toggle_flip_y(StereoMode::SideBySide);
    EXPECT_TRUE(config.flip_y);
    EXPECT_TRUE(config.swap_eyes);

    config.toggle_swap_eyes();
    EXPECT_FALSE(config.swap_eyes);
}
