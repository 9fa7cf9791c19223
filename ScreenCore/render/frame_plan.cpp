#include "frame_plan.hpp"

#include <EASTL/algorithm.h>
#include <magic_enum.hpp>
#include <spdlog/fmt/fmt.h>

bool is_persistent_resource(const FrameResource resource) {
    switch(resource) {
    case FrameResource::SourceVideo:
        [[fallthrough]];
    case FrameResource::HistorySlot0:
        [[fallthrough]];
    case FrameResource::HistorySlot1:
        return true;

    default:
        return false;
    }
}

FrameResource get_history_slot_resource(const uint32_t slot) {
    if(slot > 1) {
        throw InvalidFramePlanException{fmt::format("History slot {} does not exist", slot)};
    }
    return slot == 0 ? FrameResource::HistorySlot0 : FrameResource::HistorySlot1;
}

FramePlan build_frame_plan(const FramePlanSettings& settings) {
    auto plan = FramePlan{};
    if(!settings.source_available) {
        return plan;
    }

    if(settings.flat_background_enabled) {
        plan.push_back(
            PlannedPass{
                .kind = PlannedPassKind::FlatBackground,
                .reads = {FrameResource::SourceVideo},
                .writes = {FrameResource::ScreenColor},
            }
        );
    }

    auto screen_pass = PlannedPass{
        .kind = PlannedPassKind::Screen,
        .reads = {FrameResource::SourceVideo},
        .writes = {FrameResource::ScreenColor},
    };
    if(settings.flat_background_enabled) {
        // Drawn on top of the background instead of clearing it
        screen_pass.reads.push_back(FrameResource::ScreenColor);
    }
    plan.push_back(screen_pass);

    plan.push_back(
        PlannedPass{
            .kind = PlannedPassKind::TemporalBlend,
            .reads = {FrameResource::ScreenColor, get_history_slot_resource(settings.history_read_slot)},
            .writes = {FrameResource::DisplayOutput, get_history_slot_resource(settings.history_write_slot)},
        }
    );

    if(settings.ambient_enabled) {
        plan.push_back(
            PlannedPass{
                .kind = PlannedPassKind::Ambient,
                .reads = {FrameResource::DisplayOutput},
                .writes = {FrameResource::AmbientOutput},
            }
        );
    }

    return plan;
}

HistoryUpdate plan_history_update(const FramePlan& plan, const bool has_history) {
    const auto blends = eastl::any_of(
        plan.begin(),
        plan.end(),
        [](const PlannedPass& pass) { return pass.kind == PlannedPassKind::TemporalBlend; });

    return HistoryUpdate{
        .clear_read_slot = blends && !has_history,
        .swap = blends,
    };
}

void validate_frame_plan(const FramePlan& plan) {
    auto written = eastl::fixed_vector<FrameResource, 8>{};

    for(const auto& pass : plan) {
        for(const auto resource : pass.reads) {
            if(is_persistent_resource(resource)) {
                continue;
            }

            if(eastl::find(written.begin(), written.end(), resource) == written.end()) {
                throw InvalidFramePlanException{
                    fmt::format(
                        "Pass {} reads {} before any pass writes it",
                        magic_enum::enum_name(pass.kind),
                        magic_enum::enum_name(resource)
                    )
                };
            }
        }

        if(pass.kind == PlannedPassKind::TemporalBlend) {
            for(const auto resource : pass.writes) {
                if(eastl::find(pass.reads.begin(), pass.reads.end(), resource) != pass.reads.end()) {
                    throw InvalidFramePlanException{
                        fmt::format("Temporal blend reads and writes {}", magic_enum::enum_name(resource))
                    };
                }
            }
        }

        for(const auto resource : pass.writes) {
            written.push_back(resource);
        }
    }
}
