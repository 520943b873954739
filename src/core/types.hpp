#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace vinyl {

namespace fs = std::filesystem;

using u8 = uint8_t;
using u32 = uint32_t;
using u64 = uint64_t;
using i32 = int32_t;
using i64 = int64_t;
using f32 = float;
using f64 = double;

} // namespace vinyl
