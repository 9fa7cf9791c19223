#pragma once

#include <string>

#include "render/backend/command_buffer.hpp"
#include "render/backend/render_pass.hpp"

class ResourceAccessTracker;
class RenderBackend;

/**
 * Basic render graph
 *
 * Can automatically handle resource transitions
 *
 * Render passes are always executed in the order they're received. Intended usage is for you to make a new render
 * graph each frame, add passes to it, then submit it to the backend for execution. Passes may not run until the end of
 * the frame, but they'll always run the same frame your submit the graph
 *
 * This render graph does not allocate resources. Resource allocation should be handled with the ResourceAllocator
 * class
 */
class RenderGraph {
public:
    explicit RenderGraph(RenderBackend& backend_in);

    void add_clear_pass(const ClearPass& pass);

    /**
     * Adds a pass that can do arbitrary work outside of a render pass
     */
    void add_pass(ComputePass pass);

    void add_render_pass(DynamicRenderingPass pass);

    void begin_label(const std::string& label);

    void end_label();

    void finish() const;

    // Kinda-internal API, useful only to Backend

    CommandBuffer&& extract_command_buffer();

    /**
     * Tells the graph what state a texture is in. Useful for textures that are written outside of the graph, such as
     * video frames from a decoder
     */
    void set_resource_usage(const TextureUsageToken& texture_usage_token, bool skip_barrier = true) const;

    uint32_t get_num_passes() const;

private:
    RenderBackend& backend;

    ResourceAccessTracker& access_tracker;

    CommandBuffer cmds;

    uint32_t num_passes = 0;

    void update_accesses_and_issue_barriers(const TextureUsageList& textures, const BufferUsageList& buffers) const;
};
