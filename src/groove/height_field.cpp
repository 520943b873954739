#include "groove/height_field.hpp"

#include <algorithm>
#include <cassert>
#include <utility>

namespace vinyl::groove {

HeightField::HeightField(u32 size)
    : size_(size), data_(static_cast<size_t>(size) * size, 0.0f) {}

HeightField::HeightField(u32 size, std::vector<f32> data)
    : size_(size), data_(std::move(data)) {
    assert(data_.size() == static_cast<size_t>(size_) * size_);
}

f32 HeightField::at_clamped(i64 x, i64 y) const {
    const i64 last = static_cast<i64>(size_) - 1;
    x = std::clamp<i64>(x, 0, last);
    y = std::clamp<i64>(y, 0, last);
    return at(static_cast<u32>(x), static_cast<u32>(y));
}

} // namespace vinyl::groove
