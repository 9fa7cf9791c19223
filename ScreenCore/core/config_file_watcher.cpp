#include "config_file_watcher.hpp"

#include "core/system_interface.hpp"

static std::shared_ptr<spdlog::logger> logger;

ConfigFileWatcher::ConfigFileWatcher(std::filesystem::path path_in) : path{std::move(path_in)} {
    if(logger == nullptr) {
        logger = SystemInterface::get().get_logger("ConfigFileWatcher");
    }

    auto error = std::error_code{};
    const auto write_time = std::filesystem::last_write_time(path, error);
    if(!error) {
        last_write_time = write_time;
    }
}

tl::optional<AppConfig> ConfigFileWatcher::poll() {
    auto error = std::error_code{};
    const auto write_time = std::filesystem::last_write_time(path, error);
    if(error) {
        logger->trace("Could not stat {}: {}", path.string(), error.message());
        return tl::nullopt;
    }

    if(last_write_time && *last_write_time == write_time) {
        return tl::nullopt;
    }

    last_write_time = write_time;

    try {
        auto config = AppConfig::load_from_file(path);
        logger->info("Reloaded {}", path.string());
        return config;
    } catch(const ConfigParseException& e) {
        logger->error("Could not reload {}: {}", path.string(), e.what());
        return tl::nullopt;
    }
}

const std::filesystem::path& ConfigFileWatcher::get_path() const {
    return path;
}
