#pragma once

#include <filesystem>
#include <fstream>
#include <string>

#include <gtest/gtest.h>

/**
 * File in the system temp directory, named after the running test, removed when this goes out of scope
 */
class TempFile {
public:
    explicit TempFile(const std::string& suffix) {
        const auto* test_info = testing::UnitTest::GetInstance()->current_test_info();
        path = std::filesystem::temp_directory_path() /
            (std::string{test_info->test_suite_name()} + "_" + test_info->name() + suffix);
    }

    TempFile(const TempFile& other) = delete;

    TempFile& operator=(const TempFile& other) = delete;

    ~TempFile() {
        auto error = std::error_code{};
        std::filesystem::remove(path, error);
    }

    void write(const std::string& contents) const {
        auto file = std::ofstream{path, std::ios::binary | std::ios::trunc};
        file << contents;
    }

    const std::filesystem::path& get_path() const {
        return path;
    }

private:
    std::filesystem::path path;
};
