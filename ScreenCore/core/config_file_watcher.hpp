#pragma once

#include <filesystem>

#include <tl/optional.hpp>

#include "core/app_config.hpp"

/**
 * Reloads the config file when it changes on disk
 */
class ConfigFileWatcher {
public:
    explicit ConfigFileWatcher(std::filesystem::path path_in);

    /**
     * Checks the file's last write time. Returns the reloaded config if the file changed since the last poll, and
     * nothing otherwise
     *
     * A file that changed but doesn't parse is logged and skipped. Its write time is remembered, so the broken file
     * isn't parsed again until it changes
     */
    tl::optional<AppConfig> poll();

    const std::filesystem::path& get_path() const;

private:
    std::filesystem::path path;

    tl::optional<std::filesystem::file_time_type> last_write_time;
};
