#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "bake/bake_pipeline.hpp"
#include "groove/height_synth.hpp"
#include "groove_test_util.hpp"
#include "png_test_util.hpp"

#include <fstream>

using namespace vinyl;
using namespace vinyl::bake;
using Catch::Matchers::WithinAbs;

namespace {

/// One center at the UV origin, a disc covering the whole grid and a label
/// guard covering the whole disc: a perfectly flat plane.
GrooveConfig flat_config() {
    GrooveConfig config;
    config.size = 8;
    config.centers = {{0.0, 0.0}};
    config.disc_radius = 1000.0;
    config.inner_label_guard = 1.0;
    return config;
}

fs::path scratch_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / ("vinylbake_" + name);
    fs::remove_all(dir);
    return dir;
}

} // namespace

TEST_CASE("Flat label plane bakes to straight-up normals", "[bake]") {
    GrooveConfig config = flat_config();

    groove::HeightField field = test::make_synth(config).build_height_field();
    for (f32 h : field.data()) {
        CHECK_THAT(h, WithinAbs(config.separator_depth, 1e-6));
    }

    BakeReport report;
    auto png = bake_to_memory(config, groove::groove_hash, &report);
    REQUIRE(png.ok());
    CHECK(report.width == 8);
    CHECK(report.height == 8);
    CHECK(report.file_bytes == png.value().size());

    auto decoded = test::decode_png(png.value());
    REQUIRE(decoded.ok);
    REQUIRE(decoded.pixels.size() == 8 * 8 * 4);
    for (size_t i = 0; i < decoded.pixels.size(); i += 4) {
        CHECK((decoded.pixels[i] == 127 || decoded.pixels[i] == 128));
        CHECK((decoded.pixels[i + 1] == 127 || decoded.pixels[i + 1] == 128));
        CHECK(decoded.pixels[i + 2] == 255);
        CHECK(decoded.pixels[i + 3] == 255);
    }
}

TEST_CASE("In-memory bake is reproducible", "[bake]") {
    GrooveConfig config = baked_preset();
    config.size = 32;

    auto a = bake_to_memory(config);
    config.worker_threads = 3;
    auto b = bake_to_memory(config);
    REQUIRE(a.ok());
    REQUIRE(b.ok());
    CHECK(a.value() == b.value());

    auto decoded = test::decode_png(a.value());
    REQUIRE(decoded.ok);
    CHECK(decoded.width == 32);
    CHECK(decoded.height == 32);
}

TEST_CASE("Bake writes the PNG and creates missing directories", "[bake]") {
    fs::path dir = scratch_dir("bake_output");
    fs::path target = dir / "public" / "vinyl-normal.png";

    GrooveConfig config = baked_preset();
    config.size = 16;
    auto result = bake(config, target);
    REQUIRE(result.ok());

    CHECK(fs::exists(target));
    CHECK_FALSE(fs::exists(dir / "public" / "vinyl-normal.png.tmp"));
    CHECK(result.value().output_path == target);
    CHECK(result.value().file_bytes == fs::file_size(target));
    CHECK(result.value().width == 16);

    fs::remove_all(dir);
}

TEST_CASE("Invalid configuration fails before touching the filesystem", "[bake]") {
    fs::path dir = scratch_dir("bake_invalid");
    fs::path target = dir / "out.png";

    GrooveConfig config = baked_preset();
    config.size = 16;
    config.centers.clear();

    auto result = bake(config, target);
    REQUIRE_FALSE(result.ok());
    CHECK(result.error().message.find("Invalid configuration") == 0);
    CHECK_FALSE(fs::exists(dir));
}

TEST_CASE("Bake fails when the output directory cannot be created", "[bake]") {
    fs::path dir = scratch_dir("bake_blocked");
    fs::create_directories(dir);
    fs::path blocker = dir / "public";
    {
        std::ofstream f(blocker);
        f << "not a directory";
    }
    fs::path target = blocker / "vinyl-normal.png";

    GrooveConfig config = baked_preset();
    config.size = 8;
    auto result = bake(config, target);
    REQUIRE_FALSE(result.ok());
    CHECK(result.error().message.find("Failed to create directory") == 0);
    CHECK(fs::is_regular_file(blocker));
    CHECK_FALSE(fs::exists(target));

    fs::remove_all(dir);
}

TEST_CASE("Bake reports an empty output path", "[bake]") {
    GrooveConfig config = baked_preset();
    config.size = 4;
    CHECK_FALSE(bake(config, fs::path{}).ok());
}
