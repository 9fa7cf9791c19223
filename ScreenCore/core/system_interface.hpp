#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/logger.h>
#include <tl/optional.hpp>

/**
 * Interface to the system
 */
class SystemInterface
{
public:
    /**
     * Installs the system interface that get() returns. If nothing is installed when get() is first called, a
     * DesktopSystemInterface is created
     */
    static void initialize(std::unique_ptr<SystemInterface> instance_in);

    static SystemInterface& get();

    virtual ~SystemInterface() = default;

    /**
     * Gets a system logger with the specified name
     *
     * The logger may print to a file, to the system logs, to stdout, to somewhere else
     */
    virtual std::shared_ptr<spdlog::logger> get_logger(const std::string& name) = 0;

    virtual void flush_all_loggers() = 0;

    /**
     * Reads a file in its entirety
     *
     * This method returns an empty optional if the file can't be read. It returns a zero-length vector if the file can
     * be read but just happens to have no data
     */
    virtual tl::optional<std::vector<uint8_t>> load_file(const std::filesystem::path& filepath) = 0;

    /**
     * Writes some data to a file
     */
    virtual void write_file(const std::filesystem::path& filepath, const void* data, uint32_t data_size) = 0;
};

/**
 * Desktop implementation. Logs to stdout and to a log file next to the working directory
 */
class DesktopSystemInterface final : public SystemInterface {
public:
    explicit DesktopSystemInterface(std::filesystem::path log_file_path_in = "output.log");

    std::shared_ptr<spdlog::logger> get_logger(const std::string& name) override;

    void flush_all_loggers() override;

    tl::optional<std::vector<uint8_t>> load_file(const std::filesystem::path& filepath) override;

    void write_file(const std::filesystem::path& filepath, const void* data, uint32_t data_size) override;

private:
    std::filesystem::path log_file_path;

    /**
     * Every logger writes to the same file, so they share one sink
     */
    spdlog::sink_ptr file_sink;
};
