#include "system_interface.hpp"

#include <fstream>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

DesktopSystemInterface::DesktopSystemInterface(std::filesystem::path log_file_path_in) :
    log_file_path{std::move(log_file_path_in)} {
    file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file_path.string(), true);
}

std::shared_ptr<spdlog::logger> DesktopSystemInterface::get_logger(const std::string& name) {
    if(auto existing_logger = spdlog::get(name)) {
        return existing_logger;
    }

    auto sinks = std::vector<spdlog::sink_ptr>{
        std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
        file_sink,
    };
    sinks[0]->set_pattern("[%n] [%^%l%$] %v");
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());

#ifndef NDEBUG
    logger->set_level(spdlog::level::trace);
#endif

    // Register the logger so we can access it later if needed
    spdlog::register_logger(logger);

    return logger;
}

void DesktopSystemInterface::flush_all_loggers() {
    spdlog::apply_all(
        [](const std::shared_ptr<spdlog::logger>& logger) {
            logger->flush();
        }
    );
}

tl::optional<std::vector<uint8_t>> DesktopSystemInterface::load_file(const std::filesystem::path& filepath) {
    std::ifstream file{filepath, std::ios::binary};

    if(!file.is_open()) {
        spdlog::warn("Could not open file {}", filepath.string());
        return tl::nullopt;
    }

    // get its size:
    file.seekg(0, std::ios::end);
    const auto file_size = file.tellg();
    file.seekg(0, std::ios::beg);

    // read the data:
    std::vector<uint8_t> file_data(static_cast<size_t>(file_size));
    file.read(reinterpret_cast<char*>(file_data.data()), file_size);

    return file_data;
}

void DesktopSystemInterface::write_file(
    const std::filesystem::path& filepath, const void* data, const uint32_t data_size
) {
    if(filepath.has_parent_path()) {
        std::filesystem::create_directories(filepath.parent_path());
    }

    auto file = std::ofstream{filepath, std::ios::binary};

    if(!file.is_open()) {
        spdlog::error("Could not open file {} for writing", filepath.string());
        return;
    }

    file.write(static_cast<const char*>(data), data_size);
}
