#pragma once

#include <volk.h>

bool is_depth_format(VkFormat format);

VkImageAspectFlags to_aspect_flags(VkFormat format);
