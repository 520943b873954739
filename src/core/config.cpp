#include "core/config.hpp"

#include <algorithm>
#include <cmath>

namespace vinyl {

namespace {

bool positive(f64 value) {
    return std::isfinite(value) && value > 0.0;
}

bool noise_is_finite(const GrooveNoise& n) {
    const f64 values[] = {
        n.radial_amp_1, n.radial_freq_1, n.radial_amp_2, n.radial_freq_2,
        n.angular_amp, n.angular_freq, n.angular_center_scale,
        n.ring_amp, n.ring_freq, n.ring_center_scale, n.jitter_scale,
        n.max_offset_fraction, n.track_width_min, n.track_width_range,
    };
    return std::all_of(std::begin(values), std::end(values),
                       [](f64 x) { return std::isfinite(x); });
}

} // namespace

f64 GrooveConfig::max_height() const {
    return std::max(groove_depth, separator_depth);
}

GrooveConfig baked_preset() {
    return GrooveConfig{};
}

GrooveConfig runtime_preset() {
    GrooveConfig config;
    config.size = 6144;
    config.ring_count = 240;
    config.groove_width = 0.22;
    config.inner_label_guard = 0.35;
    return config;
}

Result<GrooveConfig> preset_by_name(std::string_view name) {
    if (name == "baked") return baked_preset();
    if (name == "runtime") return runtime_preset();
    return Error("Unknown preset '" + std::string(name) +
                 "' (expected 'baked' or 'runtime')");
}

Result<void> validate(const GrooveConfig& config) {
    if (config.size == 0) {
        return Error("size must be at least 1");
    }
    if (!positive(config.uv_span)) {
        return Error("uv_span must be positive");
    }
    if (!positive(config.disc_radius)) {
        return Error("disc_radius must be positive");
    }
    if (config.ring_count == 0) {
        return Error("ring_count must be at least 1");
    }
    if (!positive(config.groove_width)) {
        return Error("groove_width must be positive");
    }
    if (config.separator_interval == 0) {
        return Error("separator_interval must be at least 1");
    }
    if (!std::isfinite(config.groove_depth) || config.groove_depth < 0.0 ||
        !std::isfinite(config.separator_depth) || config.separator_depth < 0.0) {
        return Error("groove_depth and separator_depth must be non-negative");
    }
    if (!std::isfinite(config.separator_width_multiplier) ||
        !std::isfinite(config.inner_label_guard) ||
        !std::isfinite(config.normal_strength)) {
        return Error("non-finite groove constant");
    }
    if (!noise_is_finite(config.noise)) {
        return Error("non-finite noise constant");
    }
    if (config.sample_offsets.empty()) {
        return Error("sample_offsets must not be empty");
    }
    for (f64 offset : config.sample_offsets) {
        if (!std::isfinite(offset) || offset < 0.0 || offset >= 1.0) {
            return Error("sample offset " + std::to_string(offset) +
                         " outside [0, 1)");
        }
    }
    if (config.centers.empty()) {
        return Error("at least one basis center is required");
    }
    for (const auto& c : config.centers) {
        if (!std::isfinite(c.u) || !std::isfinite(c.v)) {
            return Error("non-finite basis center");
        }
    }
    if (config.compression_level < 0 || config.compression_level > 9) {
        return Error("compression_level must be in 0..9, got " +
                     std::to_string(config.compression_level));
    }
    return {};
}

} // namespace vinyl
