#include "command_allocator.hpp"

#include <spdlog/logger.h>
#include <spdlog/fmt/fmt.h>
#include <vulkan/vk_enum_string_helper.h>

#include "render/backend/render_backend.hpp"
#include "core/system_interface.hpp"

static std::shared_ptr<spdlog::logger> logger;

CommandAllocator::CommandAllocator(RenderBackend& backend_in, const uint32_t queue_index) : backend{&backend_in} {
    if(logger == nullptr) {
        logger = SystemInterface::get().get_logger("CommandAllocator");
    }

    const auto create_info = VkCommandPoolCreateInfo{
        .sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO,
        .queueFamilyIndex = queue_index,
    };

    const auto result = vkCreateCommandPool(backend->get_device(), &create_info, nullptr, &command_pool);
    if(result != VK_SUCCESS) {
        throw std::runtime_error{fmt::format("Could not create command pool: {}", string_VkResult(result))};
    }

    backend->set_object_name(command_pool, fmt::format("Command pool for queue family {}", queue_index));
}

CommandAllocator::CommandAllocator(CommandAllocator&& old) noexcept :
    backend{old.backend}, command_pool{old.command_pool}, command_buffers{std::move(old.command_buffers)},
    available_command_buffers{std::move(old.available_command_buffers)} {
    old.command_pool = VK_NULL_HANDLE;
}

CommandAllocator::~CommandAllocator() {
    if(command_pool == VK_NULL_HANDLE) {
        return;
    }

    // Destroying the pool frees every command buffer allocated from it
    vkDestroyCommandPool(backend->get_device(), command_pool, nullptr);
    command_pool = VK_NULL_HANDLE;
}

VkCommandBuffer CommandAllocator::allocate_command_buffer(const std::string& name) {
    if(!available_command_buffers.empty()) {
        auto commands = available_command_buffers.back();
        available_command_buffers.pop_back();
        backend->set_object_name(commands, name);
        return commands;
    }

    const auto alloc_info = VkCommandBufferAllocateInfo{
        .sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO,
        .commandPool = command_pool,
        .level = VK_COMMAND_BUFFER_LEVEL_PRIMARY,
        .commandBufferCount = 1,
    };

    auto commands = VkCommandBuffer{};
    const auto result = vkAllocateCommandBuffers(backend->get_device(), &alloc_info, &commands);
    if(result != VK_SUCCESS) {
        throw std::runtime_error{fmt::format("Could not allocate command buffer: {}", string_VkResult(result))};
    }

    backend->set_object_name(commands, name);

    return commands;
}

void CommandAllocator::return_command_buffer(const VkCommandBuffer buffer) {
    command_buffers.push_back(buffer);
}

void CommandAllocator::reset() {
    const auto result = vkResetCommandPool(backend->get_device(), command_pool, 0);
    if(result != VK_SUCCESS) {
        throw std::runtime_error{fmt::format("Could not reset command pool: {}", string_VkResult(result))};
    }

    logger->trace("Recycling {} command buffers", command_buffers.size());

    available_command_buffers.insert(available_command_buffers.end(), command_buffers.begin(), command_buffers.end());
    command_buffers.clear();
}
