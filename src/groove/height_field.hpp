#pragma once

#include "core/types.hpp"

#include <vector>

namespace vinyl::groove {

/// Square grid of groove depths, row-major [y * size + x].
/// Row 0 is the top of the image.
class HeightField {
public:
    explicit HeightField(u32 size);
    HeightField(u32 size, std::vector<f32> data);

    u32 size() const { return size_; }

    /// Raw height at (x, y) (no bounds check).
    f32 at(u32 x, u32 y) const { return data_[static_cast<size_t>(y) * size_ + x]; }

    /// Height with coordinates clamped to the border.
    f32 at_clamped(i64 x, i64 y) const;

    /// Mutable view of one row, for the synthesis pass.
    f32* row(u32 y) { return data_.data() + static_cast<size_t>(y) * size_; }

    const std::vector<f32>& data() const { return data_; }

private:
    u32 size_;
    std::vector<f32> data_;
};

} // namespace vinyl::groove
