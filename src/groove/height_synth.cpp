#include "groove/height_synth.hpp"

#include "core/parallel.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>
#include <spdlog/spdlog.h>

namespace vinyl::groove {

HeightSynthesizer::HeightSynthesizer(GrooveConfig config, HashFn hash)
    : config_(std::move(config)), hash_(std::move(hash)) {}

Result<HeightSynthesizer> HeightSynthesizer::create(GrooveConfig config,
                                                    HashFn hash) {
    if (auto valid = validate(config); !valid) {
        return valid.error();
    }
    if (!hash) {
        return Error("hash function is empty");
    }
    return HeightSynthesizer(std::move(config), std::move(hash));
}

NearestCenter HeightSynthesizer::nearest_center(f64 u, f64 v) const {
    const f64 span = config_.uv_span;
    NearestCenter best;
    best.distance = std::numeric_limits<f64>::infinity();
    if (!config_.centers.empty()) {
        best.u = config_.centers[0].u;
        best.v = config_.centers[0].v;
    }

    for (u32 i = 0; i < config_.centers.size(); ++i) {
        const BasisCenter& c = config_.centers[i];
        // Nearest periodic image of the center along V
        f64 effective_v = c.v + std::floor((v - c.v) / span + 0.5) * span;
        f64 distance = std::hypot(u - c.u, v - effective_v);
        if (distance < best.distance) {
            best.index = i;
            best.u = c.u;
            best.v = effective_v;
            best.distance = distance;
        }
    }
    return best;
}

f64 HeightSynthesizer::rotation_noise(const NearestCenter& c, f64 u, f64 v,
                                      f64 radius_norm) const {
    const GrooveNoise& n = config_.noise;
    f64 angle = std::atan2(v - c.v, u - c.u);
    f64 ring = std::floor(radius_norm * config_.ring_count);

    f64 raw = n.angular_amp * std::sin(angle * n.angular_freq + c.u * n.angular_center_scale) +
              n.ring_amp * std::sin(radius_norm * n.ring_freq + c.v * n.ring_center_scale) +
              (hash_(ring + c.u * 17.0) - 0.5) * n.jitter_scale;

    f64 limit = config_.groove_width * n.max_offset_fraction;
    return std::clamp(raw, -limit, limit);
}

GrooveSample HeightSynthesizer::sample(f64 px, f64 py) const {
    const f64 size = static_cast<f64>(config_.size);
    // V grows upward while pixel rows grow downward
    f64 u = (px / size) * config_.uv_span;
    f64 v = (1.0 - py / size) * config_.uv_span;

    GrooveSample s;
    s.center = nearest_center(u, v);

    if (s.center.distance > config_.disc_radius) {
        s.region = Region::OutsideDisc;
        s.height = 0.0;
        return s;
    }

    s.radius_norm = std::min(s.center.distance / config_.disc_radius, 1.0);
    if (s.radius_norm < config_.inner_label_guard) {
        s.region = Region::Label;
        s.height = config_.separator_depth;
        return s;
    }

    const GrooveNoise& n = config_.noise;
    f64 radial_variation =
        n.radial_amp_1 * std::sin(s.radius_norm * n.radial_freq_1 + s.center.u) +
        n.radial_amp_2 * std::sin(s.radius_norm * n.radial_freq_2 + s.center.v);
    f64 warped_radius = std::clamp(s.radius_norm + radial_variation, 0.0, 1.0);

    f64 base_position = warped_radius * config_.ring_count;
    s.track_index = static_cast<i64>(std::floor(base_position));
    bool is_separator = s.track_index % config_.separator_interval == 0;

    // Separator bands stay perfectly regular
    f64 position = base_position;
    if (!is_separator) {
        position += rotation_noise(s.center, u, v, s.radius_norm);
    }
    s.phase = std::fmod(std::fmod(position, 1.0) + 1.0, 1.0);

    if (is_separator) {
        s.region = Region::Separator;
        f64 band = config_.groove_width * config_.separator_width_multiplier;
        s.height = s.phase < band ? config_.separator_depth : 0.0;
        return s;
    }

    s.region = Region::Groove;
    f64 track_variation =
        n.track_width_min +
        hash_(static_cast<f64>(s.track_index) * 19.19 + s.center.v * 23.3 +
              static_cast<f64>(s.center.index) * 11.17) *
            n.track_width_range;
    f64 width = config_.groove_width * track_variation;
    if (s.phase >= width) {
        s.height = 0.0;
        return s;
    }

    f64 local = s.phase / width;
    f64 triangle = 1.0 - std::fabs(local * 2.0 - 1.0);
    s.height = triangle * config_.groove_depth;
    return s;
}

f64 HeightSynthesizer::height(f64 px, f64 py) const {
    return sample(px, py).height;
}

f64 HeightSynthesizer::texel_height(u32 x, u32 y) const {
    const f64 last = static_cast<f64>(config_.size) - 1.0;
    const auto& offsets = config_.sample_offsets;

    f64 accum = 0.0;
    for (f64 oy : offsets) {
        for (f64 ox : offsets) {
            f64 sx = std::min(last, static_cast<f64>(x) + ox);
            f64 sy = std::min(last, static_cast<f64>(y) + oy);
            accum += height(sx, sy);
        }
    }
    return accum / static_cast<f64>(offsets.size() * offsets.size());
}

HeightField HeightSynthesizer::build_height_field() const {
    const u32 size = config_.size;
    HeightField field(size);

    u32 workers = resolve_worker_count(config_.worker_threads, size);
    spdlog::debug("Synthesizing {}x{} height field ({} samples/texel, {} workers)",
                  size, size,
                  config_.sample_offsets.size() * config_.sample_offsets.size(),
                  workers);

    parallel_rows(size, workers, [&](u32 y) {
        f32* row = field.row(y);
        for (u32 x = 0; x < size; ++x) {
            row[x] = static_cast<f32>(texel_height(x, y));
        }
    });
    return field;
}

} // namespace vinyl::groove
