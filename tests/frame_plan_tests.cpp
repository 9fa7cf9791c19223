#include <algorithm>

#include <gtest/gtest.h>

#include "render/frame_plan.hpp"
#include "render/history_buffer.hpp"

static eastl::fixed_vector<PlannedPassKind, 4> get_kinds(const FramePlan& plan) {
    auto kinds = eastl::fixed_vector<PlannedPassKind, 4>{};
    for(const auto& pass : plan) {
        kinds.push_back(pass.kind);
    }
    return kinds;
}

TEST(FramePlan, DefaultOrderIsScreenThenBlendThenAmbient) {
    const auto plan = build_frame_plan({});

    const auto kinds = get_kinds(plan);
    ASSERT_EQ(kinds.size(), 3u);
    EXPECT_EQ(kinds[0], PlannedPassKind::Screen);
    EXPECT_EQ(kinds[1], PlannedPassKind::TemporalBlend);
    EXPECT_EQ(kinds[2], PlannedPassKind::Ambient);

    EXPECT_NO_THROW(validate_frame_plan(plan));
}

TEST(FramePlan, FlatBackgroundComesFirst) {
    const auto plan = build_frame_plan({.flat_background_enabled = true});

    const auto kinds = get_kinds(plan);
    ASSERT_EQ(kinds.size(), 4u);
    EXPECT_EQ(kinds[0], PlannedPassKind::FlatBackground);
    EXPECT_EQ(kinds[1], PlannedPassKind::Screen);

    // The screen draws over the background instead of replacing it
    const auto& screen_reads = plan[1].reads;
    EXPECT_NE(
        std::find(screen_reads.begin(), screen_reads.end(), FrameResource::ScreenColor),
        screen_reads.end());

    EXPECT_NO_THROW(validate_frame_plan(plan));
}

TEST(FramePlan, AmbientCanBeDisabled) {
    const auto plan = build_frame_plan({.ambient_enabled = false});

    const auto kinds = get_kinds(plan);
    ASSERT_EQ(kinds.size(), 2u);
    EXPECT_EQ(kinds.back(), PlannedPassKind::TemporalBlend);
}

TEST(FramePlan, BlendReadsOneHistorySlotAndWritesTheOther) {
    for(const auto read_slot : {0u, 1u}) {
        const auto plan = build_frame_plan({.history_read_slot = read_slot, .history_write_slot = 1 - read_slot});
        const auto& blend = plan[1];
        ASSERT_EQ(blend.kind, PlannedPassKind::TemporalBlend);

        EXPECT_EQ(blend.reads[1], get_history_slot_resource(read_slot));
        EXPECT_EQ(blend.writes[1], get_history_slot_resource(1 - read_slot));
        EXPECT_NO_THROW(validate_frame_plan(plan));
    }
}

TEST(FramePlan, SameHistorySlotForReadAndWriteIsRejected) {
    const auto plan = build_frame_plan({.history_read_slot = 1, .history_write_slot = 1});

    EXPECT_THROW(validate_frame_plan(plan), InvalidFramePlanException);
}

TEST(FramePlan, MissingHistorySlotIsRejected) {
    EXPECT_THROW(build_frame_plan({.history_read_slot = 2, .history_write_slot = 0}), InvalidFramePlanException);
}

TEST(FramePlan, ReadingBeforeWritingIsRejected) {
    auto plan = build_frame_plan({});
    std::swap(plan[0], plan[2]);

    EXPECT_THROW(validate_frame_plan(plan), InvalidFramePlanException);
}

TEST(FramePlan, OnlyExternalResourcesPersist) {
    EXPECT_TRUE(is_persistent_resource(FrameResource::SourceVideo));
    EXPECT_TRUE(is_persistent_resource(FrameResource::HistorySlot0));
    EXPECT_TRUE(is_persistent_resource(FrameResource::HistorySlot1));
    EXPECT_FALSE(is_persistent_resource(FrameResource::ScreenColor));
    EXPECT_FALSE(is_persistent_resource(FrameResource::DisplayOutput));
    EXPECT_FALSE(is_persistent_resource(FrameResource::AmbientOutput));
}

TEST(FramePlan, NoSourceMeansNoPasses) {
    const auto plan = build_frame_plan({.source_available = false, .flat_background_enabled = true});

    EXPECT_TRUE(plan.empty());
    EXPECT_NO_THROW(validate_frame_plan(plan));
}

TEST(HistoryUpdate, FirstBlendClearsAndSwaps) {
    const auto update = plan_history_update(build_frame_plan({}), false);

    EXPECT_TRUE(update.clear_read_slot);
    EXPECT_TRUE(update.swap);
}

TEST(HistoryUpdate, LaterBlendsOnlySwap) {
    const auto update = plan_history_update(build_frame_plan({}), true);

    EXPECT_FALSE(update.clear_read_slot);
    EXPECT_TRUE(update.swap);
}

TEST(HistoryUpdate, FrameWithoutBlendLeavesHistoryAlone) {
    for(const auto has_history : {false, true}) {
        const auto update = plan_history_update(build_frame_plan({.source_available = false}), has_history);

        EXPECT_FALSE(update.clear_read_slot);
        EXPECT_FALSE(update.swap);
    }
}

/**
 * Plans one frame against the history and applies the update the way ScreenRenderer does
 */
static HistoryUpdate run_frame(HistoryBuffer& history, const bool source_available) {
    const auto plan = build_frame_plan(
        {
            .source_available = source_available,
            .history_read_slot = history.get_read_slot(),
            .history_write_slot = history.get_write_slot()
        });
    validate_frame_plan(plan);

    const auto update = plan_history_update(plan, !history.needs_clear());
    if(update.swap) {
        history.swap();
    }
    return update;
}

TEST(HistoryUpdate, ConsecutiveBlendsAlternateSlots) {
    auto history = HistoryBuffer{};

    EXPECT_TRUE(run_frame(history, true).clear_read_slot);
    EXPECT_EQ(history.get_read_slot(), 1u);

    EXPECT_FALSE(run_frame(history, true).clear_read_slot);
    EXPECT_EQ(history.get_read_slot(), 0u);

    EXPECT_FALSE(run_frame(history, true).clear_read_slot);
    EXPECT_EQ(history.get_read_slot(), 1u);
}

TEST(HistoryUpdate, SkippedFramesKeepTheHistory) {
    auto history = HistoryBuffer{};

    run_frame(history, false);
    EXPECT_TRUE(history.needs_clear());
    EXPECT_EQ(history.get_read_slot(), 0u);

    run_frame(history, true);
    run_frame(history, false);
    EXPECT_FALSE(history.needs_clear());
    EXPECT_EQ(history.get_read_slot(), 1u);

    // The next blend reads what the last recorded blend wrote
    const auto update = run_frame(history, true);
    EXPECT_FALSE(update.clear_read_slot);
    EXPECT_EQ(history.get_read_slot(), 0u);
}
