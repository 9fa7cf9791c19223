#pragma once

#include <cstdint>

/**
 * Number of frames we record ahead of the GPU. Per-frame resources (uniform buffers, command pools, descriptor pools)
 * are duplicated this many times
 */
constexpr static uint32_t num_in_flight_frames = 2;

/**
 * Number of views rendered by the multiview passes. One per eye
 */
constexpr static uint32_t num_eye_views = 2;

/**
 * View mask with one bit per eye
 */
constexpr static uint32_t stereo_view_mask = 0b11;
