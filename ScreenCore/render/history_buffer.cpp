#include "history_buffer.hpp"

void HistoryBuffer::set_textures(const TextureHandle slot_0, const TextureHandle slot_1) {
    slots = {slot_0, slot_1};
    reset();
}

void HistoryBuffer::reset() {
    read_slot = 0;
    has_history = false;
}

TextureHandle HistoryBuffer::get_read_texture() const {
    return slots[read_slot];
}

TextureHandle HistoryBuffer::get_write_texture() const {
    return slots[get_write_slot()];
}

uint32_t HistoryBuffer::get_read_slot() const {
    return read_slot;
}

uint32_t HistoryBuffer::get_write_slot() const {
    return 1 - read_slot;
}

bool HistoryBuffer::needs_clear() const {
    return !has_history;
}

void HistoryBuffer::swap() {
    read_slot = get_write_slot();
    has_history = true;
}
