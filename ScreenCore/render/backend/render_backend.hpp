#pragma once

#include <array>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <volk.h>
#include <tracy/TracyVulkan.hpp>

#include "render/backend/descriptor_set_allocator.hpp"
#include "render/backend/render_graph.hpp"
#include "render/backend/resource_access_tracker.hpp"
#include "render/backend/resource_allocator.hpp"
#include "render/backend/command_allocator.hpp"
#include "render/backend/pipeline_builder.hpp"
#include "render/backend/constants.hpp"

class PipelineCache;

/**
 * Vulkan objects created by the host, usually an XR runtime. The backend uses them but never destroys them
 */
struct VulkanContext {
    VkInstance instance = VK_NULL_HANDLE;

    VkPhysicalDevice physical_device = VK_NULL_HANDLE;

    /**
     * Device with Vulkan 1.3 core features dynamicRendering and synchronization2, and Vulkan 1.1 multiview enabled
     */
    VkDevice device = VK_NULL_HANDLE;

    VkQueue graphics_queue = VK_NULL_HANDLE;

    uint32_t graphics_queue_family_index = 0;
};

/**
 * Semaphore the next submission waits on, and the stages that wait for it
 */
struct SemaphoreWait {
    VkSemaphore semaphore = VK_NULL_HANDLE;

    VkPipelineStageFlags stages = VK_PIPELINE_STAGE_ALL_COMMANDS_BIT;
};

/**
 * Wraps a lot of low level Vulkan concerns
 *
 * The render backend is very stateful. It knows the current frame index, it has per-frame command and descriptor
 * pools, etc.
 *
 * When the frame begins, the backend does a couple of things:
 * - Wait for the GPU to finish processing the last commands for the current frame index
 * - Recycles the command buffers and descriptor sets for this frame, and destroys resources that were waiting on it
 */
class RenderBackend {
public:
    /**
     * Creates the global backend on top of the host's Vulkan objects. Throws if the backend already exists
     */
    static RenderBackend& initialize(const VulkanContext& context);

    /**
     * Gets the global backend. Throws if initialize() hasn't been called
     */
    static RenderBackend& get();

    static bool is_initialized();

    /**
     * Waits for the GPU to go idle and destroys the global backend
     */
    static void shutdown();

    explicit RenderBackend(const VulkanContext& context);

    RenderBackend(const RenderBackend& other) = delete;

    RenderBackend& operator=(const RenderBackend& other) = delete;

    ~RenderBackend();

    RenderGraph create_render_graph();

    /**
     * Ends the graph's command buffer and queues it for submission. The queued command buffers are submitted by
     * flush_batched_command_buffers
     */
    void execute_graph(RenderGraph&& render_graph);

    /**
     * Submits every queued command buffer to the graphics queue, signalling this frame's fence
     *
     * @param waits Semaphores the submission waits on, such as an XR swapchain acquire
     * @param signals Semaphores the submission signals, such as an XR swapchain release
     */
    void flush_batched_command_buffers(
        std::span<const SemaphoreWait> waits = {}, std::span<const VkSemaphore> signals = {}
    );

    void wait_for_idle() const;

    VkInstance get_instance() const;

    VkPhysicalDevice get_physical_device() const;

    const VkPhysicalDeviceProperties& get_physical_device_properties() const;

    VkDevice get_device() const;

    VkQueue get_graphics_queue() const;

    uint32_t get_graphics_queue_family_index() const;

    GraphicsPipelineBuilder begin_building_pipeline(std::string_view name) const;

    uint32_t get_current_gpu_frame() const;

    uint64_t get_total_num_frames() const;

    /**
     * Begins the frame
     *
     * Waits for the GPU to finish with this frame, does some beginning-of-frame setup, is generally cool
     */
    void advance_frame();

    TracyVkCtx get_tracy_context() const;

    ResourceAllocator& get_global_allocator() const;

    ResourceAccessTracker& get_resource_access_tracker();

    PipelineCache& get_pipeline_cache() const;

    /**
     * Descriptor allocator for descriptors that will persist for a while
     *
     * Callers should save and re-use these descriptors
     */
    DescriptorSetAllocator& get_persistent_descriptor_allocator();

    /**
     * Descriptor allocator for descriptors that can be blown away after this frame
     *
     * Callers should make no effort to save these descriptors
     */
    DescriptorSetAllocator& get_transient_descriptor_allocator();

    CommandBuffer create_graphics_command_buffer(const std::string& name);

    VkSampler get_default_sampler() const;

    template <typename VulkanType>
    void set_object_name(VulkanType object, const std::string& name) const;

private:
    static inline std::unique_ptr<RenderBackend> g_render_backend = nullptr;

    uint32_t cur_frame_idx = 0;

    uint64_t total_num_frames = 0;

    VulkanContext context;

    VkPhysicalDeviceProperties physical_device_properties = {};

    ResourceAccessTracker resource_access_tracker;

    std::unique_ptr<ResourceAllocator> allocator;

    std::unique_ptr<PipelineCache> pipeline_cache;

    VkCommandPool tracy_command_pool = VK_NULL_HANDLE;
    VkCommandBuffer tracy_command_buffer = VK_NULL_HANDLE;
    TracyVkCtx tracy_context = nullptr;

    DescriptorSetAllocator global_descriptor_allocator;

    std::array<DescriptorSetAllocator, num_in_flight_frames> frame_descriptor_allocators;

    VkSampler default_sampler = VK_NULL_HANDLE;

    std::array<VkFence, num_in_flight_frames> frame_fences = {};

    /**
     * Whether anything has signalled the frame's fence since it was last reset
     */
    std::array<bool, num_in_flight_frames> is_fence_pending = {};

    std::vector<CommandAllocator> graphics_command_allocators;

    std::vector<CommandBuffer> queued_command_buffers;

    void create_tracy_context();

    void collect_tracy_data(const CommandBuffer& commands) const;

    void set_object_name(uint64_t object_handle, VkObjectType object_type, const std::string& name) const;
};

template <typename VulkanType>
void RenderBackend::set_object_name(VulkanType object, const std::string& name) const {
    auto object_type = VK_OBJECT_TYPE_UNKNOWN;
    if constexpr(std::is_same_v<VulkanType, VkImage>) {
        object_type = VK_OBJECT_TYPE_IMAGE;
    } else if constexpr(std::is_same_v<VulkanType, VkImageView>) {
        object_type = VK_OBJECT_TYPE_IMAGE_VIEW;
    } else if constexpr(std::is_same_v<VulkanType, VkBuffer>) {
        object_type = VK_OBJECT_TYPE_BUFFER;
    } else if constexpr(std::is_same_v<VulkanType, VkSampler>) {
        object_type = VK_OBJECT_TYPE_SAMPLER;
    } else if constexpr(std::is_same_v<VulkanType, VkPipeline>) {
        object_type = VK_OBJECT_TYPE_PIPELINE;
    } else if constexpr(std::is_same_v<VulkanType, VkPipelineLayout>) {
        object_type = VK_OBJECT_TYPE_PIPELINE_LAYOUT;
    } else if constexpr(std::is_same_v<VulkanType, VkDescriptorSet>) {
        object_type = VK_OBJECT_TYPE_DESCRIPTOR_SET;
    } else if constexpr(std::is_same_v<VulkanType, VkQueue>) {
        object_type = VK_OBJECT_TYPE_QUEUE;
    } else if constexpr(std::is_same_v<VulkanType, VkFence>) {
        object_type = VK_OBJECT_TYPE_FENCE;
    } else if constexpr(std::is_same_v<VulkanType, VkCommandPool>) {
        object_type = VK_OBJECT_TYPE_COMMAND_POOL;
    } else if constexpr(std::is_same_v<VulkanType, VkCommandBuffer>) {
        object_type = VK_OBJECT_TYPE_COMMAND_BUFFER;
    } else {
        static_assert(sizeof(VulkanType) == 0, "Invalid object type");
    }

    set_object_name(reinterpret_cast<uint64_t>(object), object_type, name);
}
