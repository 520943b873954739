#pragma once

#include "core/types.hpp"

#include <vector>

namespace vinyl::image {

/// 8-bit RGBA pixels, row-major, top row first.
struct RgbaImage {
    u32 width = 0;
    u32 height = 0;
    std::vector<u8> pixels; // width * height * 4

    RgbaImage() = default;
    RgbaImage(u32 w, u32 h)
        : width(w), height(h), pixels(static_cast<size_t>(w) * h * 4, 0) {}

    size_t row_bytes() const { return static_cast<size_t>(width) * 4; }

    u8* pixel(u32 x, u32 y) {
        return pixels.data() + (static_cast<size_t>(y) * width + x) * 4;
    }
    const u8* pixel(u32 x, u32 y) const {
        return pixels.data() + (static_cast<size_t>(y) * width + x) * 4;
    }
};

} // namespace vinyl::image
