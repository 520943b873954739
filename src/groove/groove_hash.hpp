#pragma once

#include "core/types.hpp"

#include <functional>

namespace vinyl::groove {

/// Deterministic pseudo-random function mapping a real number to [0, 1).
using HashFn = std::function<f64(f64)>;

/// fract(|sin(x * 127.1 + 311.7) * 43758.5453|). Pattern generator, not a
/// secure hash.
f64 groove_hash(f64 x);

/// Always 0.5: centered jitter terms vanish and every track gets the same
/// width factor.
f64 neutral_hash(f64 x);

} // namespace vinyl::groove
