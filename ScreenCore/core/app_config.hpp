#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

#include <tl/optional.hpp>

#include "core/stereo_mode.hpp"
#include "shared/screen_params.hpp"

namespace Json {
    class Value;
}

class ConfigParseException final : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * User-facing settings of the virtual screen
 *
 * Can be loaded from a JSON file with the same keys as the fields below. Keys that are missing keep their defaults. An
 * optional "cvars" object sets console variables by name
 */
struct AppConfig {
    float x_curvature = 0.4f;

    float y_curvature = 0.08f;

    bool swap_eyes = true;

    bool flip_x = false;

    bool flip_y = false;

    /**
     * Distance from the viewer to the screen
     */
    float distance = 20.f;

    /**
     * Width of the screen
     */
    float scale = 40.f;

    tl::optional<std::filesystem::path> config_file = tl::nullopt;

    /**
     * Reads a config file. Throws ConfigParseException if the file can't be read or isn't valid
     */
    static AppConfig load_from_file(const std::filesystem::path& path);

    /**
     * Parses a config from a JSON string. Throws ConfigParseException if the JSON is malformed or a value has the wrong
     * type
     */
    static AppConfig parse(const std::string& json_text);

    void toggle_swap_eyes();

    /**
     * Mirrors the source horizontally. Mirroring a side-by-side frame also trades the halves, so the eyes are swapped
     * to keep each eye on its own image
     */
    void toggle_flip_x(StereoMode mode);

    void toggle_flip_y(StereoMode mode);

    ScreenParams to_screen_params(
        float aspect_ratio, StereoMode mode, uint32_t screen_width, uint32_t ambient_width
    ) const;

private:
    static void apply_cvar_overrides(const Json::Value& cvars);
};
