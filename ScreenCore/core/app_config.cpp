#include "app_config.hpp"

#include <memory>

#include <json/json.h>
#include <magic_enum.hpp>
#include <spdlog/fmt/fmt.h>

#include "core/cvar_overrides.hpp"
#include "core/system_interface.hpp"

static std::shared_ptr<spdlog::logger> logger;

static void init_logger() {
    if(logger == nullptr) {
        logger = SystemInterface::get().get_logger("AppConfig");
    }
}

static void read_float(const Json::Value& root, const char* key, float& value) {
    if(!root.isMember(key)) {
        return;
    }

    const auto& json_value = root[key];
    if(!json_value.isNumeric()) {
        throw ConfigParseException{fmt::format("Config key {} must be a number", key)};
    }

    value = json_value.asFloat();
}

static void read_bool(const Json::Value& root, const char* key, bool& value) {
    if(!root.isMember(key)) {
        return;
    }

    const auto& json_value = root[key];
    if(!json_value.isBool()) {
        throw ConfigParseException{fmt::format("Config key {} must be true or false", key)};
    }

    value = json_value.asBool();
}

AppConfig AppConfig::load_from_file(const std::filesystem::path& path) {
    init_logger();

    const auto file_data = SystemInterface::get().load_file(path);
    if(!file_data) {
        throw ConfigParseException{fmt::format("Could not read config file {}", path.string())};
    }

    logger->info("Loading config file {}", path.string());

    auto config = parse(std::string{file_data->begin(), file_data->end()});
    config.config_file = path;

    return config;
}

AppConfig AppConfig::parse(const std::string& json_text) {
    init_logger();

    auto builder = Json::CharReaderBuilder{};
    Json::CharReaderBuilder::strictMode(&builder.settings_);
    const auto reader = std::unique_ptr<Json::CharReader>{builder.newCharReader()};

    auto root = Json::Value{};
    auto errors = std::string{};
    if(!reader->parse(json_text.data(), json_text.data() + json_text.size(), &root, &errors)) {
        throw ConfigParseException{fmt::format("Malformed config: {}", errors)};
    }

    if(!root.isObject()) {
        throw ConfigParseException{"Config root must be an object"};
    }

    auto config = AppConfig{};
    read_float(root, "x_curvature", config.x_curvature);
    read_float(root, "y_curvature", config.y_curvature);
    read_bool(root, "swap_eyes", config.swap_eyes);
    read_bool(root, "flip_x", config.flip_x);
    read_bool(root, "flip_y", config.flip_y);
    read_float(root, "distance", config.distance);
    read_float(root, "scale", config.scale);

    if(root.isMember("cvars")) {
        apply_cvar_overrides(root["cvars"]);
    }

    logger->debug(
        "Config: curvature=({}, {}) swap_eyes={} flip=({}, {}) distance={} scale={}",
        config.x_curvature,
        config.y_curvature,
        config.swap_eyes,
        config.flip_x,
        config.flip_y,
        config.distance,
        config.scale
    );

    return config;
}

void AppConfig::apply_cvar_overrides(const Json::Value& cvars) {
    if(!cvars.isObject()) {
        throw ConfigParseException{"\"cvars\" must be an object"};
    }

    for(const auto& name : cvars.getMemberNames()) {
        const auto& value = cvars[name];
        try {
            if(value.isBool()) {
                CvarOverrides::set_number(name, value.asBool() ? 1.0 : 0.0);
            } else if(value.isNumeric()) {
                CvarOverrides::set_number(name, value.asDouble());
            } else if(value.isString()) {
                CvarOverrides::set_string(name, value.asString());
            } else {
                throw ConfigParseException{fmt::format("CVar {} must be a number, a bool, or a string", name)};
            }
        } catch(const CvarNotFoundException& e) {
            throw ConfigParseException{e.what()};
        } catch(const CvarTypeMismatchException& e) {
            throw ConfigParseException{e.what()};
        }
    }
}

void AppConfig::toggle_swap_eyes() {
    swap_eyes = !swap_eyes;
}

void AppConfig::toggle_flip_x(const StereoMode mode) {
    init_logger();

    flip_x = !flip_x;
    if(mode == StereoMode::SideBySide) {
        toggle_swap_eyes();
    }
    logger->debug("flip_x={} swap_eyes={} ({})", flip_x, swap_eyes, magic_enum::enum_name(mode));
}

void AppConfig::toggle_flip_y(const StereoMode mode) {
    init_logger();

    flip_y = !flip_y;
    logger->debug("flip_y={} ({})", flip_y, magic_enum::enum_name(mode));
}

ScreenParams AppConfig::to_screen_params(
    const float aspect_ratio, const StereoMode mode, const uint32_t screen_width, const uint32_t ambient_width
) const {
    return ScreenParams{
        .x_curvature = x_curvature,
        .y_curvature = y_curvature,
        .eye_offset = swap_eyes ? 1.f : 0.f,
        .y_offset = flip_y ? 1.f : 0.f,
        .x_offset = flip_x ? 1.f : 0.f,
        .aspect_ratio = aspect_ratio,
        .screen_width = screen_width,
        .ambient_width = ambient_width,
        .stereo_x = mode == StereoMode::SideBySide ? 1.f : 0.f,
        .stereo_y = 0.f,
        .padding0 = 0.f,
        .padding1 = 0.f,
    };
}
