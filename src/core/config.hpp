#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace vinyl {

/// Reference point in UV space around which concentric grooves are laid out.
struct BasisCenter {
    f64 u = 0.0;
    f64 v = 0.0;
};

/// Sinusoid and jitter constants that perturb the otherwise perfectly
/// circular rings. Setting every amplitude to zero leaves pure geometry.
struct GrooveNoise {
    // Radial warp: a1*sin(r*f1 + cu) + a2*sin(r*f2 + cv)
    f64 radial_amp_1 = 0.02;
    f64 radial_freq_1 = 80.0;
    f64 radial_amp_2 = 0.013;
    f64 radial_freq_2 = 200.0;

    // Rotation noise: b1*sin(angle*g1 + cu*k1) + b2*sin(r*g2 + cv*k2) + jitter
    f64 angular_amp = 0.08;
    f64 angular_freq = 16.0;
    f64 angular_center_scale = 7.0;
    f64 ring_amp = 0.03;
    f64 ring_freq = 180.0;
    f64 ring_center_scale = 11.0;
    f64 jitter_scale = 0.15;

    // Rotation noise is clamped to +-groove_width * max_offset_fraction.
    f64 max_offset_fraction = 0.18;

    // Per-track groove width factor lies in [track_width_min,
    // track_width_min + track_width_range].
    f64 track_width_min = 0.65;
    f64 track_width_range = 0.55;
};

/// Every constant the bake depends on. Passed by value into each stage.
struct GrooveConfig {
    u32 size = 2048;          // output is size x size texels
    f64 uv_span = 10.0;
    f64 disc_radius = 2.6;
    u32 ring_count = 200;
    f64 groove_width = 0.5;   // fraction of one track
    f64 groove_depth = 1.0;
    u32 separator_interval = 48;
    f64 separator_width_multiplier = 2.5;
    f64 separator_depth = 0.45;
    f64 inner_label_guard = 0.445; // normalized radius of the flat label
    f64 normal_strength = 1.85;
    std::vector<f64> sample_offsets = {0.15, 0.5, 0.85};
    std::vector<BasisCenter> centers = {{2.5, 2.5}, {2.5, 7.5}};
    GrooveNoise noise;

    u32 worker_threads = 0;   // 0 = hardware concurrency
    int compression_level = 9;

    /// Upper bound of any synthesized height.
    f64 max_height() const;
};

/// Preset used for the baked asset (public/vinyl-normal.png).
GrooveConfig baked_preset();

/// Finer preset matching the in-browser reference generator.
GrooveConfig runtime_preset();

/// Look up a preset by name ("baked" or "runtime").
Result<GrooveConfig> preset_by_name(std::string_view name);

/// Check that a configuration can be baked.
Result<void> validate(const GrooveConfig& config);

} // namespace vinyl
