#include <cstdint>

#include <gtest/gtest.h>

#include "render/history_buffer.hpp"

// The history buffer never dereferences its textures, so any distinct addresses do
static const auto texture_a = reinterpret_cast<TextureHandle>(uintptr_t{0x1000});
static const auto texture_b = reinterpret_cast<TextureHandle>(uintptr_t{0x2000});

TEST(HistoryBuffer, StartsReadingSlotZero) {
    auto history = HistoryBuffer{};
    history.set_textures(texture_a, texture_b);

    EXPECT_EQ(history.get_read_slot(), 0u);
    EXPECT_EQ(history.get_write_slot(), 1u);
    EXPECT_EQ(history.get_read_texture(), texture_a);
    EXPECT_EQ(history.get_write_texture(), texture_b);
    EXPECT_TRUE(history.needs_clear());
}

TEST(HistoryBuffer, SwapTurnsTheWriteSlotIntoTheReadSlot) {
    auto history = HistoryBuffer{};
    history.set_textures(texture_a, texture_b);

    history.swap();
    EXPECT_EQ(history.get_read_texture(), texture_b);
    EXPECT_EQ(history.get_write_texture(), texture_a);
    EXPECT_FALSE(history.needs_clear());

    history.swap();
    EXPECT_EQ(history.get_read_texture(), texture_a);
    EXPECT_EQ(history.get_write_texture(), texture_b);
}

TEST(HistoryBuffer, NeverReadsAndWritesTheSameSlot) {
    auto history = HistoryBuffer{};
    history.set_textures(texture_a, texture_b);

    for(auto frame = 0; frame < 5; frame++) {
        EXPECT_NE(history.get_read_slot(), history.get_write_slot());
        EXPECT_NE(history.get_read_texture(), history.get_write_texture());
        history.swap();
    }
}

TEST(HistoryBuffer, NewTexturesNeedClearing) {
    auto history = HistoryBuffer{};
    history.set_textures(texture_a, texture_b);
    history.swap();

    history.set_textures(texture_b, texture_a);

    EXPECT_TRUE(history.needs_clear());
    EXPECT_EQ(history.get_read_texture(), texture_b);
}

TEST(HistoryBuffer, ResetForgetsTheHistory) {
    auto history = HistoryBuffer{};
    history.set_textures(texture_a, texture_b);
    history.swap();

    history.reset();

    EXPECT_TRUE(history.needs_clear());
    EXPECT_EQ(history.get_read_slot(), 0u);
}
