#pragma once

#include <string>
#include <vector>

#include <volk.h>

class RenderBackend;

/**
 * Hands out primary command buffers for one frame in flight
 *
 * Command buffers go back to the allocator after they're submitted, and become available again once the allocator is
 * reset at the start of the frame that next uses it
 */
class CommandAllocator {
public:
    CommandAllocator(RenderBackend& backend_in, uint32_t queue_index);

    CommandAllocator(const CommandAllocator& other) = delete;
    CommandAllocator& operator=(const CommandAllocator& other) = delete;

    CommandAllocator(CommandAllocator&& old) noexcept;
    CommandAllocator& operator=(CommandAllocator&& old) noexcept = delete;

    ~CommandAllocator();

    VkCommandBuffer allocate_command_buffer(const std::string& name);

    /**
     * Marks a submitted command buffer as in-flight. It becomes available again after reset()
     */
    void return_command_buffer(VkCommandBuffer buffer);

    void reset();

private:
    RenderBackend* backend;

    VkCommandPool command_pool = VK_NULL_HANDLE;

    std::vector<VkCommandBuffer> command_buffers;

    std::vector<VkCommandBuffer> available_command_buffers;
};
