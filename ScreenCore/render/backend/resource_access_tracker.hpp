#pragma once

#include <EASTL/vector.h>
#include <EASTL/fixed_vector.h>
#include <volk.h>

#include "render/backend/usage_token.hpp"
#include "render/backend/handles.hpp"

class CommandBuffer;

/**
 * Tracks resource access, and allows querying for resource barriers
 *
 * Usage persists across frames, so a texture that's written one frame and read the next gets the right barrier
 */
class ResourceAccessTracker {
public:
    ResourceAccessTracker();

    void set_resource_usage(const TextureUsageToken& usage, bool skip_barrier = false);

    void set_resource_usage(const BufferUsageToken& usage);

    /**
     * Records all pending barriers into the command buffer
     */
    void issue_barriers(const CommandBuffer& commands);

    /**
     * Drops all knowledge of a texture, so that a new texture at the same address starts from an undefined layout
     */
    void forget(TextureHandle texture_handle);

    void forget(BufferHandle buffer_handle);

private:
    eastl::vector<BufferUsageToken> last_buffer_usages;

    eastl::vector<TextureUsageToken> last_texture_usages;

    eastl::fixed_vector<VkBufferMemoryBarrier2, 32> buffer_barriers;

    eastl::fixed_vector<VkImageMemoryBarrier2, 32> image_barriers;
};
