#pragma once

#include "groove/height_field.hpp"
#include "image/rgba_image.hpp"

namespace vinyl::normal {

struct Normal {
    f64 x = 0.0;
    f64 y = 0.0;
    f64 z = 1.0;
};

/// Unit tangent-space normal at texel (x, y) from central differences.
/// Neighbor lookups clamp to the border; the field is not wrapped even though
/// the synthesized grooves tile vertically.
Normal compute_normal(const groove::HeightField& field, u32 x, u32 y,
                      f64 strength);

/// Map a component in [-1, 1] to [0, 255].
u8 encode_component(f64 c);

/// Encode every texel of the field as an opaque RGBA normal.
image::RgbaImage encode_normals(const groove::HeightField& field, f64 strength,
                                u32 worker_threads = 0);

} // namespace vinyl::normal
