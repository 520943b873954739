#pragma once

#include "core/config.hpp"
#include "groove/groove_hash.hpp"
#include "groove/height_field.hpp"

namespace vinyl::groove {

/// Which part of the record a sample landed on.
enum class Region : u8 {
    OutsideDisc = 0, // beyond disc_radius of every center
    Label       = 1, // flat label area inside inner_label_guard
    Separator   = 2, // wide flat band every separator_interval tracks
    Groove      = 3, // ordinary triangular groove track
};

/// Nearest basis center for a UV position, after V wrapping.
struct NearestCenter {
    u32 index = 0;
    f64 u = 0.0;       // center coordinates (v already wrapped)
    f64 v = 0.0;
    f64 distance = 0.0;
};

/// Full result of one sub-sample evaluation.
struct GrooveSample {
    f64 height = 0.0;
    Region region = Region::OutsideDisc;
    NearestCenter center;
    f64 radius_norm = 0.0;
    i64 track_index = -1;  // -1 outside the grooved area
    f64 phase = 0.0;
};

/// Procedural vinyl groove height field. Pure and safe to call concurrently.
class HeightSynthesizer {
public:
    /// Validates the config; a synthesizer only exists for a usable config.
    static Result<HeightSynthesizer> create(GrooveConfig config,
                                            HashFn hash = groove_hash);

    /// Groove depth at pixel position (px, py). Row 0 is the top of the image.
    f64 height(f64 px, f64 py) const;

    /// Same as height(), with the classification that produced it.
    GrooveSample sample(f64 px, f64 py) const;

    /// Nearest center to (u, v). Ties keep the earlier center.
    NearestCenter nearest_center(f64 u, f64 v) const;

    /// Mean of height() over the sample-offset grid for texel (x, y).
    f64 texel_height(u32 x, u32 y) const;

    /// Supersample every texel into a materialized field.
    HeightField build_height_field() const;

    const GrooveConfig& config() const { return config_; }

private:
    HeightSynthesizer(GrooveConfig config, HashFn hash);

    GrooveConfig config_;
    HashFn hash_;

    f64 rotation_noise(const NearestCenter& c, f64 u, f64 v, f64 radius_norm) const;
};

} // namespace vinyl::groove
