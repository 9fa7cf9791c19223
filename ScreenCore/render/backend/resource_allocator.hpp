#pragma once

#include <string>

#include <EASTL/array.h>
#include <EASTL/vector.h>
#include <EASTL/unordered_map.h>
#include <glm/vec2.hpp>
#include <plf_colony.h>

#include "render/backend/gpu_texture.hpp"
#include "render/backend/handles.hpp"
#include "render/backend/buffer.hpp"
#include "render/backend/constants.hpp"

class RenderBackend;

/**
 * How a texture might be used
 */
enum class TextureUsage {
    /**
     * The texture will be rendered to by the rasterizer. It may be sampled or copied from
     */
    RenderTarget,

    /**
     * The texture will have data uploaded or copied into it. It may be sampled
     */
    StaticImage,
};

/**
 * How a buffer might be used
 */
enum class BufferUsage {
    /**
     * Vertex buffer. Host-visible so meshes can be written without a staging copy
     */
    VertexBuffer,

    /**
     * Index buffer. Host-visible so meshes can be written without a staging copy
     */
    IndexBuffer,

    /**
     * Uniform buffer. Persistently mapped so the CPU can write to it whenever. Be careful with synchronizing these
     */
    UniformBuffer,
};

struct TextureCreateInfo {
    VkFormat format = VK_FORMAT_UNDEFINED;

    glm::uvec2 resolution = {};

    uint32_t num_mips = 1;

    TextureUsage usage = TextureUsage::StaticImage;

    uint32_t num_layers = 1;
};

/**
 * Allocates all kinds of resources
 *
 * When you use this class to delete a resource the resource isn't deleted immediately. Rather, it's added to a queue
 * that gets flushed the next time this frame index comes around, after the GPU is done with it
 */
class ResourceAllocator {
public:
    explicit ResourceAllocator(RenderBackend& backend_in);

    ~ResourceAllocator();

    TextureHandle create_texture(const std::string& name, const TextureCreateInfo& create_info);

    /**
     * Wraps an image that something else owns, such as a video decoder's output or an XR swapchain image
     *
     * The allocator never destroys the image or view, destroy_texture only forgets about them
     */
    TextureHandle register_external_texture(
        const std::string& name, VkImage image, VkImageView image_view, const VkImageCreateInfo& create_info
    );

    void destroy_texture(TextureHandle handle);

    BufferHandle create_buffer(const std::string& name, size_t size, BufferUsage usage);

    void* map_buffer(BufferHandle buffer_handle) const;

    template <typename MappedType>
    MappedType* map_buffer(BufferHandle buffer) const;

    void destroy_buffer(BufferHandle handle);

    /**
     * Get a sampler that matches the provided desc
     *
     * This method may create an actual sampler, or it may just return an existing one
     */
    VkSampler get_sampler(const VkSamplerCreateInfo& info);

    /**
     * Frees the resources in the zombie list for the given frame
     *
     * Should be called at the beginning of the frame by the backend
     *
     * @param frame_idx Index of the frame to delete resources for
     */
    void free_resources_for_frame(uint32_t frame_idx);

    void report_memory_usage() const;

    VmaAllocator get_vma() const;

private:
    RenderBackend& backend;

    VmaAllocator vma = VK_NULL_HANDLE;

    plf::colony<GpuTexture> textures;
    plf::colony<GpuBuffer> buffers;

    eastl::array<eastl::vector<BufferHandle>, num_in_flight_frames> buffer_zombie_lists;
    eastl::array<eastl::vector<TextureHandle>, num_in_flight_frames> texture_zombie_lists;

    struct SamplerCreateInfoHasher {
        std::size_t operator()(const VkSamplerCreateInfo& k) const;
    };

    // Cache from sampler create info hash to sampler
    eastl::unordered_map<std::size_t, VkSampler> sampler_cache;

    void destroy_texture_immediate(TextureHandle handle);
};

template <typename MappedType>
MappedType* ResourceAllocator::map_buffer(const BufferHandle buffer) const {
    return static_cast<MappedType*>(map_buffer(buffer));
}
