#pragma once

#include <cstdint>
#include <stdexcept>

#include <EASTL/fixed_vector.h>

enum class PlannedPassKind {
    FlatBackground,
    Screen,
    TemporalBlend,
    Ambient,
};

/**
 * Images the passes of a frame hand to each other
 */
enum class FrameResource {
    /**
     * The captured video frame. Owned by whoever captures it
     */
    SourceVideo,

    /**
     * Per-eye image of the screen, before temporal blending
     */
    ScreenColor,

    HistorySlot0,

    HistorySlot1,

    /**
     * Blended per-eye image that gets presented
     */
    DisplayOutput,

    AmbientOutput,
};

/**
 * Resources that exist before the frame begins. Everything else has to be written by an earlier pass of the same
 * frame before it can be read
 */
bool is_persistent_resource(FrameResource resource);

FrameResource get_history_slot_resource(uint32_t slot);

struct PlannedPass {
    PlannedPassKind kind;

    eastl::fixed_vector<FrameResource, 3> reads;

    eastl::fixed_vector<FrameResource, 2> writes;
};

struct FramePlanSettings {
    /**
     * Without a video frame there's nothing to draw, and the plan is empty
     */
    bool source_available = true;

    bool flat_background_enabled = false;

    bool ambient_enabled = true;

    uint32_t history_read_slot = 0;

    uint32_t history_write_slot = 1;
};

using FramePlan = eastl::fixed_vector<PlannedPass, 4>;

class InvalidFramePlanException final : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Lists the passes of one frame in the order they must execute
 *
 * The screen draw comes before the temporal blend, which comes before the ambient pass, since each one samples the
 * output of the one before it
 */
FramePlan build_frame_plan(const FramePlanSettings& settings);

/**
 * What a frame does to the history buffer around its passes
 */
struct HistoryUpdate {
    /**
     * The read slot has never been written and must be cleared before the temporal blend samples it
     */
    bool clear_read_slot = false;

    /**
     * The temporal blend wrote the other slot, which becomes next frame's read slot
     */
    bool swap = false;
};

/**
 * Decides whether the frame clears and swaps the history. Frames without a temporal blend leave it alone
 */
HistoryUpdate plan_history_update(const FramePlan& plan, bool has_history);

/**
 * Throws InvalidFramePlanException if a pass reads a resource that no earlier pass wrote and that doesn't persist
 * across frames, or if the temporal blend reads and writes the same history slot
 */
void validate_frame_plan(const FramePlan& plan);
