#pragma once

using BufferHandle = struct GpuBuffer*;

using TextureHandle = struct GpuTexture*;

using GraphicsPipelineHandle = struct GraphicsPipeline*;
