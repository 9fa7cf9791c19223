#include <chrono>

#include <gtest/gtest.h>

#include "temp_file.hpp"
#include "core/config_file_watcher.hpp"

/**
 * Moves the file's write time forward, since rewriting a file within the filesystem's timestamp resolution might not
 * change it
 */
static void touch_later(const std::filesystem::path& path) {
    const auto write_time = std::filesystem::last_write_time(path);
    std::filesystem::last_write_time(path, write_time + std::chrono::seconds{2});
}

TEST(ConfigFileWatcher, UnchangedFileIsNotReloaded) {
    const auto file = TempFile{".json"};
    file.write(R"({"scale": 10})");

    auto watcher = ConfigFileWatcher{file.get_path()};

    EXPECT_FALSE(watcher.poll().has_value());
    EXPECT_FALSE(watcher.poll().has_value());
}

TEST(ConfigFileWatcher, ChangedFileIsReloadedOnce) {
    const auto file = TempFile{".json"};
    file.write(R"({"scale": 10})");
    auto watcher = ConfigFileWatcher{file.get_path()};

    file.write(R"({"scale": 25})");
    touch_later(file.get_path());

    const auto reloaded = watcher.poll();
    ASSERT_TRUE(reloaded.has_value());
    EXPECT_FLOAT_EQ(reloaded->scale, 25.f);

    EXPECT_FALSE(watcher.poll().has_value());
}

TEST(ConfigFileWatcher, FileCreatedAfterTheWatcherIsLoaded) {
    const auto file = TempFile{".json"};
    auto watcher = ConfigFileWatcher{file.get_path()};

    EXPECT_FALSE(watcher.poll().has_value());

    file.write(R"({"distance": 3})");

    const auto loaded = watcher.poll();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_FLOAT_EQ(loaded->distance, 3.f);
}

TEST(ConfigFileWatcher, BrokenFileIsSkippedUntilItChanges) {
    const auto file = TempFile{".json"};
    file.write(R"({"scale": 10})");
    auto watcher = ConfigFileWatcher{file.get_path()};

    file.write(R"({"scale": )");
    touch_later(file.get_path());
    EXPECT_FALSE(watcher.poll().has_value());
    EXPECT_FALSE(watcher.poll().has_value());

    file.write(R"({"scale": 12})");
    touch_later(file.get_path());
    const auto fixed = watcher.poll();
    ASSERT_TRUE(fixed.has_value());
    EXPECT_FLOAT_EQ(fixed->scale, 12.f);
}

TEST(ConfigFileWatcher, KeepsItsPath) {
    const auto file = TempFile{".json"};
    const auto watcher = ConfigFileWatcher{file.get_path()};

    EXPECT_EQ(watcher.get_path(), file.get_path());
}
