#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "groove/groove_hash.hpp"

#include <vector>

namespace vinyl::bake {

/// Outcome of a successful bake.
struct BakeReport {
    fs::path output_path;
    u32 width = 0;
    u32 height = 0;
    u64 file_bytes = 0;
    f64 synth_seconds = 0.0;
    f64 normal_seconds = 0.0;
    f64 encode_seconds = 0.0;
};

/// Synthesize, encode and compress into a PNG byte stream without touching
/// the filesystem.
Result<std::vector<u8>> bake_to_memory(const GrooveConfig& config,
                                       const groove::HashFn& hash = groove::groove_hash,
                                       BakeReport* report = nullptr);

/// Full bake: validates the config, creates the output directory and writes
/// the PNG atomically.
Result<BakeReport> bake(const GrooveConfig& config, const fs::path& output_path,
                        const groove::HashFn& hash = groove::groove_hash);

} // namespace vinyl::bake
