#pragma once

#include <array>
#include <cstdint>

#include "render/backend/handles.hpp"

/**
 * Two textures that take turns holding last frame's blended image
 *
 * Each frame the temporal blend reads one slot and writes the other. swap() at the end of the frame turns this
 * frame's output into next frame's input. A slot is never read and written in the same frame
 */
class HistoryBuffer {
public:
    /**
     * Replaces both slots. The read slot's contents are undefined until the first frame writes it, so it's cleared
     * before the first read
     */
    void set_textures(TextureHandle slot_0, TextureHandle slot_1);

    void reset();

    TextureHandle get_read_texture() const;

    TextureHandle get_write_texture() const;

    uint32_t get_read_slot() const;

    uint32_t get_write_slot() const;

    /**
     * True until a frame has been written into the read slot
     */
    bool needs_clear() const;

    /**
     * Marks the write slot as filled and makes it the read slot
     */
    void swap();

private:
    std::array<TextureHandle, 2> slots = {nullptr, nullptr};

    uint32_t read_slot = 0;

    bool has_history = false;
};
