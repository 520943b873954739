#include "normal/normal_encoder.hpp"

#include "core/parallel.hpp"

#include <algorithm>
#include <cmath>

namespace vinyl::normal {

Normal compute_normal(const groove::HeightField& field, u32 x, u32 y,
                      f64 strength) {
    const i64 ix = x;
    const i64 iy = y;
    f64 left = field.at_clamped(ix - 1, iy);
    f64 right = field.at_clamped(ix + 1, iy);
    f64 top = field.at_clamped(ix, iy - 1);
    f64 bottom = field.at_clamped(ix, iy + 1);

    f64 dx = (right - left) * strength;
    f64 dy = (bottom - top) * strength;
    f64 dz = 1.0;
    f64 length = std::sqrt(dx * dx + dy * dy + dz * dz);
    if (length == 0.0) length = 1.0;

    return {dx / length, dy / length, dz / length};
}

u8 encode_component(f64 c) {
    f64 scaled = std::round((c * 0.5 + 0.5) * 255.0);
    return static_cast<u8>(std::clamp(scaled, 0.0, 255.0));
}

image::RgbaImage encode_normals(const groove::HeightField& field, f64 strength,
                                u32 worker_threads) {
    const u32 size = field.size();
    image::RgbaImage img(size, size);

    // Only reads the frozen field; each row of img has a single writer.
    parallel_rows(size, worker_threads, [&](u32 y) {
        for (u32 x = 0; x < size; ++x) {
            Normal n = compute_normal(field, x, y, strength);
            u8* px = img.pixel(x, y);
            px[0] = encode_component(n.x);
            px[1] = encode_component(n.y);
            px[2] = encode_component(n.z);
            px[3] = 255;
        }
    });
    return img;
}

} // namespace vinyl::normal
