#include <set>
#include <stdexcept>

#include <gtest/gtest.h>

#include "render/screen_render_strategy.hpp"

TEST(ScreenRenderStrategy, DefaultIsCurvedSymmetricStereo) {
    const auto strategy = ScreenRenderStrategy{};

    EXPECT_EQ(strategy.get_vertex_shader_path(), "shaders/screen_curved.vert.spv");
    EXPECT_EQ(strategy.get_fragment_shader_path(), "shaders/screen_symmetric_stereo.frag.spv");
}

TEST(ScreenRenderStrategy, ShaderPathsFollowTheVariant) {
    const auto flat_legacy_mono = ScreenRenderStrategy{
        .geometry = ScreenGeometry::Flat,
        .view_mode = ViewMode::Mono,
        .mapping = StereoMapping::Legacy,
    };

    EXPECT_EQ(flat_legacy_mono.get_vertex_shader_path(), "shaders/screen_flat.vert.spv");
    EXPECT_EQ(flat_legacy_mono.get_fragment_shader_path(), "shaders/screen_legacy_mono.frag.spv");
}

TEST(ScreenRenderStrategy, VariantIndicesAreUniqueAndRoundTrip) {
    auto seen = std::set<uint32_t>{};

    for(auto index = 0u; index < ScreenRenderStrategy::num_variants; index++) {
        const auto strategy = ScreenRenderStrategy::from_variant_index(index);
        EXPECT_EQ(strategy.get_variant_index(), index);
        seen.insert(strategy.get_variant_index());
    }

    EXPECT_EQ(seen.size(), ScreenRenderStrategy::num_variants);
}

TEST(ScreenRenderStrategy, UnknownVariantThrows) {
    EXPECT_THROW(ScreenRenderStrategy::from_variant_index(ScreenRenderStrategy::num_variants), std::out_of_range);
}

TEST(ScreenRenderStrategy, InvalidMemberHasNoVariant) {
    const auto strategy = ScreenRenderStrategy{.mapping = static_cast<StereoMapping>(5)};

    EXPECT_THROW(strategy.get_variant_index(), std::out_of_range);
}
