#include "utils.hpp"

bool is_depth_format(const VkFormat format) {
    return format == VK_FORMAT_D32_SFLOAT ||
        format == VK_FORMAT_D16_UNORM ||
        format == VK_FORMAT_X8_D24_UNORM_PACK32 ||
        format == VK_FORMAT_D16_UNORM_S8_UINT ||
        format == VK_FORMAT_D24_UNORM_S8_UINT ||
        format == VK_FORMAT_D32_SFLOAT_S8_UINT;
}

VkImageAspectFlags to_aspect_flags(const VkFormat format) {
    if(is_depth_format(format)) {
        return VK_IMAGE_ASPECT_DEPTH_BIT;
    }

    return VK_IMAGE_ASPECT_COLOR_BIT;
}
