#include "bake/bake_pipeline.hpp"

#include "groove/height_synth.hpp"
#include "image/png_writer.hpp"
#include "normal/normal_encoder.hpp"

#include <chrono>
#include <spdlog/spdlog.h>
#include <system_error>

namespace vinyl::bake {

namespace {

using Clock = std::chrono::steady_clock;

f64 seconds_since(Clock::time_point start) {
    return std::chrono::duration<f64>(Clock::now() - start).count();
}

} // namespace

Result<std::vector<u8>> bake_to_memory(const GrooveConfig& config,
                                       const groove::HashFn& hash,
                                       BakeReport* report) {
    auto synth = groove::HeightSynthesizer::create(config, hash);
    if (!synth) {
        return synth.error().prefixed("Invalid configuration");
    }

    spdlog::info("Generating height field ({}x{})...", config.size, config.size);
    auto start = Clock::now();
    groove::HeightField field = synth.value().build_height_field();
    f64 synth_seconds = seconds_since(start);

    // build_height_field() has joined all workers; the field is complete.
    spdlog::info("Encoding normals...");
    start = Clock::now();
    image::RgbaImage normals =
        normal::encode_normals(field, config.normal_strength, config.worker_threads);
    f64 normal_seconds = seconds_since(start);

    spdlog::info("Writing PNG...");
    start = Clock::now();
    auto png = image::encode_png(normals, config.compression_level);
    if (!png) {
        return png.error().prefixed("PNG encoding failed");
    }
    f64 encode_seconds = seconds_since(start);

    spdlog::debug("Stage timings: synth {:.2f}s, normals {:.2f}s, png {:.2f}s",
                  synth_seconds, normal_seconds, encode_seconds);

    if (report) {
        report->width = normals.width;
        report->height = normals.height;
        report->file_bytes = png.value().size();
        report->synth_seconds = synth_seconds;
        report->normal_seconds = normal_seconds;
        report->encode_seconds = encode_seconds;
    }
    return png.take_value();
}

Result<BakeReport> bake(const GrooveConfig& config, const fs::path& output_path,
                        const groove::HashFn& hash) {
    if (output_path.empty()) {
        return Error("Output path is empty");
    }

    BakeReport report;
    auto png = bake_to_memory(config, hash, &report);
    if (!png) {
        return png.error();
    }

    fs::path parent = output_path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            Error err("Failed to create directory " + parent.string() + ": " +
                      ec.message());
            spdlog::error("{}", err.message);
            return err;
        }
    }

    if (auto written = image::write_file_atomic(output_path, png.value()); !written) {
        spdlog::error("{}", written.error().message);
        return written.error();
    }

    report.output_path = output_path;
    report.file_bytes = png.value().size();
    spdlog::info("Wrote {} ({:.2f} MB)", output_path.string(),
                 static_cast<f64>(report.file_bytes) / (1024.0 * 1024.0));
    return report;
}

} // namespace vinyl::bake
