#pragma once

#include <volk.h>

#include <EASTL/fixed_vector.h>

#include "render/backend/handles.hpp"

/**
 * How a pass uses a texture. The render graph compares this to the texture's previous usage to decide which barrier
 * to issue
 */
struct TextureUsageToken {
    TextureHandle texture = nullptr;

    VkPipelineStageFlags2 stage = VK_PIPELINE_STAGE_2_NONE;

    VkAccessFlags2 access = VK_ACCESS_2_NONE;

    VkImageLayout layout = VK_IMAGE_LAYOUT_UNDEFINED;
};

using TextureUsageList = eastl::fixed_vector<TextureUsageToken, 32>;

struct BufferUsageToken {
    BufferHandle buffer = nullptr;

    VkPipelineStageFlags2 stage = VK_PIPELINE_STAGE_2_NONE;

    VkAccessFlags2 access = VK_ACCESS_2_NONE;
};

using BufferUsageList = eastl::fixed_vector<BufferUsageToken, 32>;
