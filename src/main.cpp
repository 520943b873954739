#include "bake/bake_pipeline.hpp"
#include "core/config.hpp"
#include "core/log.hpp"
#include "core/types.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>

namespace {

struct Options {
    vinyl::fs::path output = "public/vinyl-normal.png";
    vinyl::fs::path log_file = "vinylbake.log";
    std::string preset = "baked";
    std::optional<vinyl::u32> size;
    std::optional<vinyl::u32> threads;
    bool verbose = false;
};

void print_usage() {
    std::cout << "vinylbake v0.1.0\n"
              << "Bakes the concentric vinyl groove normal map.\n\n"
              << "Usage:\n"
              << "  vinylbake [options]\n\n"
              << "Options:\n"
              << "  --output <path>    Output PNG (default: public/vinyl-normal.png)\n"
              << "  --preset <name>    baked (2048, default) or runtime (6144)\n"
              << "  --size <n>         Override texture size in texels\n"
              << "  --threads <n>      Worker threads (default: all cores)\n"
              << "  --log <path>       Log file (empty string disables)\n"
              << "  --verbose          Debug logging\n"
              << "  --help             Show this help message\n";
}

std::optional<vinyl::u32> parse_u32(const char* text) {
    char* end = nullptr;
    unsigned long value = std::strtoul(text, &end, 10);
    if (end == text || *end != '\0' || value > 0xFFFFFFFFul) {
        return std::nullopt;
    }
    return static_cast<vinyl::u32>(value);
}

/// Returns nullopt on a malformed command line.
std::optional<Options> parse_args(int argc, char* argv[]) {
    Options opts;
    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--output") == 0 && i + 1 < argc) {
            opts.output = argv[++i];
        } else if (std::strcmp(argv[i], "--preset") == 0 && i + 1 < argc) {
            opts.preset = argv[++i];
        } else if (std::strcmp(argv[i], "--size") == 0 && i + 1 < argc) {
            opts.size = parse_u32(argv[++i]);
            if (!opts.size) return std::nullopt;
        } else if (std::strcmp(argv[i], "--threads") == 0 && i + 1 < argc) {
            opts.threads = parse_u32(argv[++i]);
            if (!opts.threads) return std::nullopt;
        } else if (std::strcmp(argv[i], "--log") == 0 && i + 1 < argc) {
            opts.log_file = argv[++i];
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            opts.verbose = true;
        } else if (std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown or incomplete option: " << argv[i] << "\n";
            return std::nullopt;
        }
    }
    return opts;
}

} // namespace

int main(int argc, char* argv[]) {
    auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage();
        return 2;
    }

    vinyl::log::init(opts->log_file, opts->verbose ? spdlog::level::debug
                                                   : spdlog::level::info);

    auto preset = vinyl::preset_by_name(opts->preset);
    if (!preset) {
        spdlog::error("{}", preset.error().message);
        vinyl::log::shutdown();
        return 2;
    }

    vinyl::GrooveConfig config = preset.take_value();
    if (opts->size) config.size = *opts->size;
    if (opts->threads) config.worker_threads = *opts->threads;

    auto result = vinyl::bake::bake(config, opts->output);
    if (!result) {
        spdlog::error("Bake failed: {}", result.error().message);
        vinyl::log::shutdown();
        return 1;
    }

    vinyl::log::shutdown();
    return 0;
}
