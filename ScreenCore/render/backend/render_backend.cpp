#include "render_backend.hpp"

#include <limits>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <tracy/Tracy.hpp>
#include <vulkan/vk_enum_string_helper.h>

#include "render/backend/pipeline_cache.hpp"
#include "console/cvars.hpp"
#include "core/system_interface.hpp"

static auto cvar_memory_report_interval = AutoCVar_Int{
    "r.RHI.MemoryReportInterval",
    "Number of frames between GPU memory usage reports. 0 disables the report",
    600
};

static std::shared_ptr<spdlog::logger> logger;

RenderBackend& RenderBackend::initialize(const VulkanContext& context) {
    if(g_render_backend != nullptr) {
        throw std::runtime_error{"Render backend already initialized"};
    }

    g_render_backend = std::make_unique<RenderBackend>(context);

    return *g_render_backend;
}

RenderBackend& RenderBackend::get() {
    if(g_render_backend == nullptr) {
        throw std::runtime_error{"Render backend not initialized! Call RenderBackend::initialize first"};
    }

    return *g_render_backend;
}

bool RenderBackend::is_initialized() {
    return g_render_backend != nullptr;
}

void RenderBackend::shutdown() {
    if(g_render_backend == nullptr) {
        return;
    }

    g_render_backend->wait_for_idle();

    // Release before destroying, so nothing reaches the half-destroyed backend through get()
    auto backend = std::move(g_render_backend);
    backend.reset();
}

RenderBackend::RenderBackend(const VulkanContext& context_in) :
    context{context_in}, global_descriptor_allocator{*this},
    frame_descriptor_allocators{DescriptorSetAllocator{*this}, DescriptorSetAllocator{*this}} {
    logger = SystemInterface::get().get_logger("RenderBackend");

    if(context.instance == VK_NULL_HANDLE || context.physical_device == VK_NULL_HANDLE ||
        context.device == VK_NULL_HANDLE || context.graphics_queue == VK_NULL_HANDLE) {
        throw std::runtime_error{"Vulkan context is incomplete"};
    }

    const auto volk_result = volkInitialize();
    if(volk_result != VK_SUCCESS) {
        throw std::runtime_error{"Could not initialize Volk, Vulkan is not available"};
    }
    volkLoadInstance(context.instance);
    volkLoadDevice(context.device);

    vkGetPhysicalDeviceProperties(context.physical_device, &physical_device_properties);
    logger->info(
        "Using device {} with Vulkan {}.{}",
        physical_device_properties.deviceName,
        VK_API_VERSION_MAJOR(physical_device_properties.apiVersion),
        VK_API_VERSION_MINOR(physical_device_properties.apiVersion));

    if(physical_device_properties.apiVersion < VK_API_VERSION_1_3) {
        throw std::runtime_error{"The screen renderer needs Vulkan 1.3"};
    }

    set_object_name(context.graphics_queue, "Graphics Queue");

    create_tracy_context();

    allocator = std::make_unique<ResourceAllocator>(*this);

    pipeline_cache = std::make_unique<PipelineCache>(*this);

    graphics_command_allocators.reserve(num_in_flight_frames);
    for(auto i = 0u; i < num_in_flight_frames; i++) {
        graphics_command_allocators.emplace_back(*this, context.graphics_queue_family_index);
    }

    constexpr auto fence_create_info = VkFenceCreateInfo{
        .sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO,
    };
    for(auto i = 0u; i < num_in_flight_frames; i++) {
        const auto result = vkCreateFence(context.device, &fence_create_info, nullptr, &frame_fences[i]);
        if(result != VK_SUCCESS) {
            throw std::runtime_error{fmt::format("Could not create frame fence: {}", string_VkResult(result))};
        }
        set_object_name(frame_fences[i], fmt::format("Frame fence {}", i));
    }

    default_sampler = allocator->get_sampler(
        VkSamplerCreateInfo{
            .sType = VK_STRUCTURE_TYPE_SAMPLER_CREATE_INFO,
            .magFilter = VK_FILTER_LINEAR,
            .minFilter = VK_FILTER_LINEAR,
            .mipmapMode = VK_SAMPLER_MIPMAP_MODE_NEAREST,
            .addressModeU = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE,
            .addressModeV = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE,
            .addressModeW = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE,
            .maxLod = VK_LOD_CLAMP_NONE,
        });

    logger->info("Initialized backend");
}

RenderBackend::~RenderBackend() {
    queued_command_buffers.clear();

    for(const auto fence : frame_fences) {
        if(fence != VK_NULL_HANDLE) {
            vkDestroyFence(context.device, fence, nullptr);
        }
    }

#if defined(TRACY_ENABLE)
    if(tracy_context != nullptr) {
        TracyVkDestroy(tracy_context);
    }
#endif
    if(tracy_command_pool != VK_NULL_HANDLE) {
        vkDestroyCommandPool(context.device, tracy_command_pool, nullptr);
    }

    logger->info("Destroyed backend");
}

RenderGraph RenderBackend::create_render_graph() {
    return RenderGraph{*this};
}

void RenderBackend::execute_graph(RenderGraph&& render_graph) {
    ZoneScoped;

    logger->debug("Executed {} passes", render_graph.get_num_passes());

    auto commands = render_graph.extract_command_buffer();
    collect_tracy_data(commands);
    commands.end();

    queued_command_buffers.emplace_back(commands);
}

void RenderBackend::flush_batched_command_buffers(
    const std::span<const SemaphoreWait> waits, const std::span<const VkSemaphore> signals
) {
    ZoneScoped;

    if(is_fence_pending[cur_frame_idx]) {
        throw std::runtime_error{
            fmt::format("Frame {} was already submitted. Call advance_frame before submitting again", cur_frame_idx)
        };
    }

    auto command_buffers = std::vector<VkCommandBuffer>{};
    command_buffers.reserve(queued_command_buffers.size());
    for(const auto& queued_commands : queued_command_buffers) {
        command_buffers.emplace_back(queued_commands.get_vk_commands());
    }

    auto wait_semaphores = std::vector<VkSemaphore>{};
    auto wait_stages = std::vector<VkPipelineStageFlags>{};
    wait_semaphores.reserve(waits.size());
    wait_stages.reserve(waits.size());
    for(const auto& wait : waits) {
        wait_semaphores.emplace_back(wait.semaphore);
        wait_stages.emplace_back(wait.stages);
    }

    if(command_buffers.empty()) {
        // Still submit, so the frame fence gets signalled
        logger->warn("No queued command buffers this frame? Things might get wonky");
    }

    const auto submit = VkSubmitInfo{
        .sType = VK_STRUCTURE_TYPE_SUBMIT_INFO,
        .waitSemaphoreCount = static_cast<uint32_t>(wait_semaphores.size()),
        .pWaitSemaphores = wait_semaphores.data(),
        .pWaitDstStageMask = wait_stages.data(),
        .commandBufferCount = static_cast<uint32_t>(command_buffers.size()),
        .pCommandBuffers = command_buffers.data(),
        .signalSemaphoreCount = static_cast<uint32_t>(signals.size()),
        .pSignalSemaphores = signals.data(),
    };

    {
        ZoneScopedN("vkQueueSubmit graphics");

        logger->trace("Submitting {} command buffers for frame {}", command_buffers.size(), cur_frame_idx);
        const auto result = vkQueueSubmit(context.graphics_queue, 1, &submit, frame_fences[cur_frame_idx]);
        if(result != VK_SUCCESS) {
            logger->error("vkQueueSubmit failed: {}", string_VkResult(result));
            logger->flush();
            throw std::runtime_error{fmt::format("Could not submit frame: {}", string_VkResult(result))};
        }
    }

    is_fence_pending[cur_frame_idx] = true;

    for(const auto& queued_commands : queued_command_buffers) {
        graphics_command_allocators[cur_frame_idx].return_command_buffer(queued_commands.get_vk_commands());
    }
    queued_command_buffers.clear();
}

void RenderBackend::wait_for_idle() const {
    const auto result = vkQueueWaitIdle(context.graphics_queue);
    if(result != VK_SUCCESS) {
        logger->error("vkQueueWaitIdle failed: {}", string_VkResult(result));
    }
}

VkInstance RenderBackend::get_instance() const {
    return context.instance;
}

VkPhysicalDevice RenderBackend::get_physical_device() const {
    return context.physical_device;
}

const VkPhysicalDeviceProperties& RenderBackend::get_physical_device_properties() const {
    return physical_device_properties;
}

VkDevice RenderBackend::get_device() const {
    return context.device;
}

VkQueue RenderBackend::get_graphics_queue() const {
    return context.graphics_queue;
}

uint32_t RenderBackend::get_graphics_queue_family_index() const {
    return context.graphics_queue_family_index;
}

void RenderBackend::advance_frame() {
    ZoneScoped;

    total_num_frames++;
    const auto report_interval = cvar_memory_report_interval.Get();
    if(report_interval > 0 && total_num_frames % static_cast<uint64_t>(report_interval) == 0) {
        allocator->report_memory_usage();
    }

    cur_frame_idx++;
    cur_frame_idx %= num_in_flight_frames;

    if(is_fence_pending[cur_frame_idx]) {
        ZoneScopedN("Wait for previous frame");
        const auto result = vkWaitForFences(
            context.device,
            1,
            &frame_fences[cur_frame_idx],
            VK_TRUE,
            std::numeric_limits<uint64_t>::max());
        if(result != VK_SUCCESS) {
            throw std::runtime_error{
                fmt::format("Waiting for frame {} failed: {}", cur_frame_idx, string_VkResult(result))
            };
        }
        logger->trace("Frame fence {} is signalled", cur_frame_idx);

        vkResetFences(context.device, 1, &frame_fences[cur_frame_idx]);
        is_fence_pending[cur_frame_idx] = false;
    }

    graphics_command_allocators[cur_frame_idx].reset();

    allocator->free_resources_for_frame(cur_frame_idx);

    frame_descriptor_allocators[cur_frame_idx].reset_pools();
}

void RenderBackend::collect_tracy_data(const CommandBuffer& commands) const {
#if defined(TRACY_ENABLE)
    TracyVkCollect(tracy_context, commands.get_vk_commands())
#endif
}

TracyVkCtx RenderBackend::get_tracy_context() const {
    return tracy_context;
}

void RenderBackend::create_tracy_context() {
#if defined(TRACY_ENABLE)
    const auto pool_create_info = VkCommandPoolCreateInfo{
        .sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO,
        .flags = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT,
        .queueFamilyIndex = context.graphics_queue_family_index,
    };
    auto result = vkCreateCommandPool(context.device, &pool_create_info, nullptr, &tracy_command_pool);
    if(result != VK_SUCCESS) {
        throw std::runtime_error{fmt::format("Could not create Tracy command pool: {}", string_VkResult(result))};
    }

    const auto command_buffer_allocate = VkCommandBufferAllocateInfo{
        .sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO,
        .commandPool = tracy_command_pool,
        .level = VK_COMMAND_BUFFER_LEVEL_PRIMARY,
        .commandBufferCount = 1,
    };
    result = vkAllocateCommandBuffers(context.device, &command_buffer_allocate, &tracy_command_buffer);
    if(result != VK_SUCCESS) {
        throw std::runtime_error{fmt::format("Could not allocate Tracy command buffer: {}", string_VkResult(result))};
    }

    tracy_context = TracyVkContext(
        context.physical_device,
        context.device,
        context.graphics_queue,
        tracy_command_buffer);
#endif
}

ResourceAllocator& RenderBackend::get_global_allocator() const {
    return *allocator;
}

GraphicsPipelineBuilder RenderBackend::begin_building_pipeline(const std::string_view name) const {
    return GraphicsPipelineBuilder{*pipeline_cache}.set_name(name);
}

uint32_t RenderBackend::get_current_gpu_frame() const {
    return cur_frame_idx;
}

uint64_t RenderBackend::get_total_num_frames() const {
    return total_num_frames;
}

ResourceAccessTracker& RenderBackend::get_resource_access_tracker() {
    return resource_access_tracker;
}

PipelineCache& RenderBackend::get_pipeline_cache() const {
    return *pipeline_cache;
}

DescriptorSetAllocator& RenderBackend::get_persistent_descriptor_allocator() {
    return global_descriptor_allocator;
}

DescriptorSetAllocator& RenderBackend::get_transient_descriptor_allocator() {
    return frame_descriptor_allocators[cur_frame_idx];
}

CommandBuffer RenderBackend::create_graphics_command_buffer(const std::string& name) {
    return CommandBuffer{
        graphics_command_allocators[cur_frame_idx].allocate_command_buffer(
            fmt::format("{} for frame {}", name, total_num_frames)),
        *this
    };
}

VkSampler RenderBackend::get_default_sampler() const {
    return default_sampler;
}

void RenderBackend::set_object_name(
    const uint64_t object_handle, const VkObjectType object_type, const std::string& name
) const {
    if(vkSetDebugUtilsObjectNameEXT != nullptr) {
        const auto name_info = VkDebugUtilsObjectNameInfoEXT{
            .sType = VK_STRUCTURE_TYPE_DEBUG_UTILS_OBJECT_NAME_INFO_EXT,
            .objectType = object_type,
            .objectHandle = object_handle,
            .pObjectName = name.c_str(),
        };
        vkSetDebugUtilsObjectNameEXT(context.device, &name_info);
    }
}
