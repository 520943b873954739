#include "groove/groove_hash.hpp"

#include <cmath>

namespace vinyl::groove {

f64 groove_hash(f64 x) {
    return std::fmod(std::fabs(std::sin(x * 127.1 + 311.7) * 43758.5453), 1.0);
}

f64 neutral_hash(f64 /*x*/) {
    return 0.5;
}

} // namespace vinyl::groove
