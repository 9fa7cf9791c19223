#include "screen_settings.hpp"

#include <algorithm>

#include "console/cvars.hpp"

static auto cvar_history_decay = AutoCVar_Float{
    "r.Screen.HistoryDecay", "How much of last frame's image is kept in the temporal blend, from 0 to 1", 0.5
};

static auto cvar_ambient_width = AutoCVar_Int{
    "r.Screen.AmbientWidth", "Width in texels that the ambient blur steps over. Smaller is blurrier", 256
};

static auto cvar_ambient_enable = AutoCVar_Int{
    "r.Screen.Ambient.Enable", "Whether to render the ambient light around the screen", 1
};

static auto cvar_stereo_mapping = AutoCVar_Enum{
    "r.Screen.StereoMapping", "How screen UVs map to the halves of a side-by-side frame", StereoMapping::Symmetric
};

static auto cvar_jitter_enable = AutoCVar_Int{
    "r.Screen.Jitter.Enable", "Whether to jitter the screen sample before the temporal blend", 1
};

static auto cvar_jitter_sequence_length = AutoCVar_Int{
    "r.Screen.Jitter.SequenceLength", "Number of Halton points before the jitter pattern repeats", 16
};

static auto cvar_jitter_scale = AutoCVar_Float{
    "r.Screen.Jitter.Scale", "Multiplier on the jitter offset", 1.0
};

static auto cvar_flat_background_enable = AutoCVar_Int{
    "r.Screen.FlatBackground.Enable", "Whether to draw a flat copy of the screen behind the curved one", 0
};

static auto cvar_mesh_resolution = AutoCVar_Int{
    "r.Screen.MeshResolution", "Vertices along each side of the curved screen mesh", 100
};

ScreenSettings ScreenSettings::get() {
    return ScreenSettings{
        .history_decay = cvar_history_decay.GetFloat(),
        .ambient_width = static_cast<uint32_t>(std::max(cvar_ambient_width.Get(), 1)),
        .ambient_enabled = cvar_ambient_enable.Get() != 0,
        .stereo_mapping = cvar_stereo_mapping.Get(),
        .jitter_enabled = cvar_jitter_enable.Get() != 0,
        .jitter_sequence_length = static_cast<uint32_t>(std::max(cvar_jitter_sequence_length.Get(), 1)),
        .jitter_scale = cvar_jitter_scale.GetFloat(),
        .flat_background_enabled = cvar_flat_background_enable.Get() != 0,
        .mesh_resolution = static_cast<uint32_t>(std::max(cvar_mesh_resolution.Get(), 2)),
    };
}

void ScreenSettings::set_ambient_enabled(const bool enabled) {
    cvar_ambient_enable.Set(enabled ? 1 : 0);
}

void ScreenSettings::set_flat_background_enabled(const bool enabled) {
    cvar_flat_background_enable.Set(enabled ? 1 : 0);
}

void ScreenSettings::set_stereo_mapping(const StereoMapping mapping) {
    cvar_stereo_mapping.Set(mapping);
}
