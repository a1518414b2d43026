#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "imgshrink/size_estimator.hpp"

using namespace imgshrink;
using Catch::Matchers::WithinAbs;

TEST_CASE("JPEG estimate follows quality", "[estimate]") {
    CompressionOptions opts;

    opts.quality = 100;
    REQUIRE(estimate_size(ImageFormat::Jpeg, 100000, opts) == 50000);

    opts.quality = 50;
    REQUIRE(estimate_size(ImageFormat::Jpeg, 100000, opts) == 30000);

    opts.quality = 1;
    // 0.1 + 0.004 = 0.104
    REQUIRE(estimate_size(ImageFormat::Jpeg, 100000, opts) == 10400);
}

TEST_CASE("PNG estimate follows compression level", "[estimate]") {
    CompressionOptions opts;

    opts.compression_level = 0;
    REQUIRE(estimate_size(ImageFormat::Png, 100000, opts) == 100000);

    opts.compression_level = 9;
    REQUIRE(estimate_size(ImageFormat::Png, 100000, opts) == 55000);

    opts.quality = 10;  // ignored for png
    REQUIRE(estimate_size(ImageFormat::Png, 100000, opts) == 55000);
}

TEST_CASE("PNG estimate never grows with a higher level", "[estimate]") {
    CompressionOptions opts;
    std::uintmax_t previous = UINTMAX_MAX;

    for (int level = 0; level <= 9; ++level) {
        opts.compression_level = level;
        auto estimate = estimate_size(ImageFormat::Png, 123457, opts);
        REQUIRE(estimate <= previous);
        previous = estimate;
    }
}

TEST_CASE("Resize area factor", "[estimate]") {
    CompressionOptions opts;
    REQUIRE_THAT(resize_area_factor(opts), WithinAbs(1.0, 1e-12));

    opts.resize_percent = 50;
    REQUIRE_THAT(resize_area_factor(opts), WithinAbs(0.25, 1e-12));

    opts.quality = 100;
    REQUIRE(estimate_size(ImageFormat::Jpeg, 100000, opts) == 12500);

    SECTION("width/height resizes do not count") {
        opts.resize_percent = 0;
        opts.resize_width = 10;
        REQUIRE_THAT(resize_area_factor(opts), WithinAbs(1.0, 1e-12));
    }

    SECTION("100 percent is not a resize") {
        opts.resize_percent = 100;
        REQUIRE_THAT(resize_area_factor(opts), WithinAbs(1.0, 1e-12));
    }
}

TEST_CASE("Empty input estimates to zero", "[estimate]") {
    REQUIRE(estimate_size(ImageFormat::Jpeg, 0, CompressionOptions{}) == 0);
    REQUIRE(estimate_size(ImageFormat::Png, 0, CompressionOptions{}) == 0);
}

TEST_CASE("PNG level to effort tier", "[options]") {
    REQUIRE(effort_for_level(0) == PngEffort::None);
    REQUIRE(effort_for_level(1) == PngEffort::Fastest);
    REQUIRE(effort_for_level(3) == PngEffort::Fastest);
    REQUIRE(effort_for_level(4) == PngEffort::Default);
    REQUIRE(effort_for_level(6) == PngEffort::Default);
    REQUIRE(effort_for_level(7) == PngEffort::Maximum);
    REQUIRE(effort_for_level(9) == PngEffort::Maximum);
}

TEST_CASE("Format views only carry their own fields", "[options]") {
    CompressionOptions opts;
    opts.quality = 42;
    opts.progressive = false;
    opts.chroma_subsample = ChromaSubsample::Yuv444;
    opts.strip_metadata = false;
    opts.compression_level = 2;
    opts.interlaced = true;

    JpegParams jpeg = opts.jpeg();
    REQUIRE(jpeg.quality == 42);
    REQUIRE_FALSE(jpeg.progressive);
    REQUIRE(jpeg.chroma == ChromaSubsample::Yuv444);
    REQUIRE_FALSE(jpeg.strip_metadata);

    PngParams png = opts.png();
    REQUIRE(png.effort == PngEffort::Fastest);
    REQUIRE(png.interlaced);
}

TEST_CASE("Options validation", "[options]") {
    REQUIRE(validate_options(default_options()).empty());

    CompressionOptions opts;
    opts.quality = 0;
    opts.compression_level = 10;
    opts.resize_percent = 120;
    opts.resize_width = -1;
    opts.resize_height = -5;
    REQUIRE(validate_options(opts).size() == 5);

    opts = CompressionOptions{};
    opts.quality = 101;
    REQUIRE(validate_options(opts).size() == 1);
}

TEST_CASE("Defaults", "[options]") {
    auto opts = default_options();
    REQUIRE(opts.quality == 85);
    REQUIRE(opts.compression_level == 6);
    REQUIRE(opts.strip_metadata);
    REQUIRE(opts.progressive);
    REQUIRE(opts.chroma_subsample == ChromaSubsample::Yuv420);
    REQUIRE_FALSE(opts.interlaced);
    REQUIRE(opts.output_dir.empty());
    REQUIRE(opts.output_suffix == "_compressed");
}

TEST_CASE("Reduction and byte formatting", "[options]") {
    REQUIRE_THAT(calculate_reduction(1000, 250), WithinAbs(75.0, 1e-9));
    REQUIRE_THAT(calculate_reduction(1000, 1500), WithinAbs(-50.0, 1e-9));
    REQUIRE_THAT(calculate_reduction(0, 10), WithinAbs(0.0, 1e-9));

    REQUIRE(format_bytes(512) == "512 B");
    REQUIRE(format_bytes(1536) == "1.5 KB");
    REQUIRE(format_bytes(3 * 1024 * 1024) == "3.0 MB");
}
