#include <catch2/catch_test_macros.hpp>
#include "exif_orient.hpp"
#include "imgshrink/compressor.hpp"
#include "imgshrink/resize.hpp"
#include "test_helpers.hpp"
#include <algorithm>
#include <iterator>
#include <stdexcept>

using namespace imgshrink;
using namespace imgshrink::test;
namespace fs = std::filesystem;

namespace {

// sampling byte of the first component in the SOF segment
uint8_t luma_sampling(const std::vector<uint8_t>& jpeg) {
    size_t sof = find_sof(jpeg);
    REQUIRE(sof != std::string::npos);
    return jpeg[sof + 11];
}

} // namespace

TEST_CASE("JPEG compression writes a smaller file", "[compressor][jpeg]") {
    TempDir dir;
    auto input = write_jpeg(dir / "photo.jpg", 160, 120, 98);

    CompressionOptions opts;
    opts.quality = 40;

    JpegCompressor jpeg;
    CompressionResult result = jpeg.compress(input, opts);

    REQUIRE(result.success);
    REQUIRE_FALSE(result.error.has_value());
    REQUIRE(result.input_path == input);
    REQUIRE(result.output_path == dir / "photo_compressed.jpg");
    REQUIRE(fs::exists(result.output_path));
    // kein temp file bleibt liegen
    auto entries = std::distance(fs::directory_iterator(dir.path()), fs::directory_iterator{});
    REQUIRE(entries == 2);

    REQUIRE(result.input_size == fs::file_size(input));
    REQUIRE(result.output_size == fs::file_size(result.output_path));
    REQUIRE(result.output_size < result.input_size);

    // exakt aus den beiden gemeldeten größen
    REQUIRE(result.reduction == calculate_reduction(result.input_size, result.output_size));
    REQUIRE(result.reduction > 0);

    REQUIRE(result.width == 160);
    REQUIRE(result.height == 120);
}

TEST_CASE("Output dimensions match the resize calculation", "[compressor]") {
    TempDir dir;
    auto jpg = write_jpeg(dir / "a.jpg", 200, 100);
    auto png = write_png(dir / "b.png", 200, 100);

    struct Case { double percent; int width; int height; };
    const Case cases[] = {
        {50, 0, 0},
        {0, 64, 0},
        {0, 0, 30},
        {0, 33, 77},
        {25, 1000, 0},
        {0, 0, 0},
    };

    JpegCompressor jpeg;
    PngCompressor pngc;

    for (const auto& c : cases) {
        CompressionOptions opts;
        opts.resize_percent = c.percent;
        opts.resize_width = c.width;
        opts.resize_height = c.height;

        Dimensions expected = compute_target_dimensions({200, 100}, opts);

        auto r1 = jpeg.compress(jpg, opts);
        REQUIRE(r1.success);
        auto h1 = probe_file(r1.output_path, ImageFormat::Jpeg);
        REQUIRE(h1.width == expected.width);
        REQUIRE(h1.height == expected.height);
        REQUIRE(r1.width == expected.width);
        REQUIRE(r1.height == expected.height);

        auto r2 = pngc.compress(png, opts);
        REQUIRE(r2.success);
        auto h2 = probe_file(r2.output_path, ImageFormat::Png);
        REQUIRE(h2.width == expected.width);
        REQUIRE(h2.height == expected.height);
    }
}

TEST_CASE("JPEG encoder parameters reach the bitstream", "[compressor][jpeg]") {
    TempDir dir;
    auto input = write_jpeg(dir / "in.jpg", 64, 64);
    JpegCompressor jpeg;

    SECTION("progressive vs baseline") {
        CompressionOptions opts;
        opts.progressive = true;
        auto r = jpeg.compress(input, opts);
        REQUIRE(r.success);
        uint8_t marker = 0;
        REQUIRE(find_sof(read_bytes(r.output_path), &marker) != std::string::npos);
        REQUIRE(marker == 0xC2);

        opts.progressive = false;
        opts.output_suffix = "_baseline";
        r = jpeg.compress(input, opts);
        REQUIRE(r.success);
        REQUIRE(find_sof(read_bytes(r.output_path), &marker) != std::string::npos);
        REQUIRE(marker != 0xC2);
    }

    SECTION("chroma subsampling") {
        CompressionOptions opts;

        opts.chroma_subsample = ChromaSubsample::Yuv444;
        opts.output_suffix = "_444";
        auto r = jpeg.compress(input, opts);
        REQUIRE(r.success);
        REQUIRE(luma_sampling(read_bytes(r.output_path)) == 0x11);

        opts.chroma_subsample = ChromaSubsample::Yuv422;
        opts.output_suffix = "_422";
        r = jpeg.compress(input, opts);
        REQUIRE(r.success);
        REQUIRE(luma_sampling(read_bytes(r.output_path)) == 0x21);

        opts.chroma_subsample = ChromaSubsample::Yuv420;
        opts.output_suffix = "_420";
        r = jpeg.compress(input, opts);
        REQUIRE(r.success);
        REQUIRE(luma_sampling(read_bytes(r.output_path)) == 0x22);
    }
}

TEST_CASE("EXIF orientation and metadata", "[compressor][jpeg][exif]") {
    TempDir dir;
    auto input = dir / "portrait.jpg";
    write_bytes(input, with_exif(jpeg_bytes(60, 30), 6));

    JpegCompressor jpeg;

    SECTION("stripped output is upright and carries no exif") {
        CompressionOptions opts;
        auto r = jpeg.compress(input, opts);
        REQUIRE(r.success);
        REQUIRE(r.width == 30);
        REQUIRE(r.height == 60);

        auto bytes = read_bytes(r.output_path);
        REQUIRE_FALSE(exif::find_app1(bytes.data(), bytes.size()).found());
        auto header = probe_file(r.output_path, ImageFormat::Jpeg);
        REQUIRE(header.width == 30);
        REQUIRE(header.height == 60);
    }

    SECTION("kept metadata is rewritten to orientation 1") {
        CompressionOptions opts;
        opts.strip_metadata = false;
        auto r = jpeg.compress(input, opts);
        REQUIRE(r.success);

        auto bytes = read_bytes(r.output_path);
        REQUIRE(exif::find_app1(bytes.data(), bytes.size()).found());
        REQUIRE(exif::read_jpeg_orientation(bytes.data(), bytes.size()) == 1);
        auto header = probe_file(r.output_path, ImageFormat::Jpeg);
        REQUIRE(header.width == 30);
        REQUIRE(header.height == 60);
    }

    SECTION("resize applies to the upright image") {
        CompressionOptions opts;
        opts.resize_width = 15;
        auto r = jpeg.compress(input, opts);
        REQUIRE(r.success);
        REQUIRE(r.width == 15);
        REQUIRE(r.height == 30);
    }
}

TEST_CASE("PNG compression", "[compressor][png]") {
    TempDir dir;
    auto input = write_png(dir / "shot.png", 96, 64, 4);
    PngCompressor png;

    SECTION("level 9 beats level 0") {
        CompressionOptions opts;
        opts.compression_level = 0;
        opts.output_suffix = "_l0";
        auto stored = png.compress(input, opts);

        opts.compression_level = 9;
        opts.output_suffix = "_l9";
        auto best = png.compress(input, opts);

        REQUIRE(stored.success);
        REQUIRE(best.success);
        REQUIRE(best.output_size < stored.output_size);
    }

    SECTION("interlace flag lands in IHDR") {
        CompressionOptions opts;
        opts.interlaced = true;
        auto r = png.compress(input, opts);
        REQUIRE(r.success);

        auto bytes = read_bytes(r.output_path);
        REQUIRE(bytes.size() > 28);
        REQUIRE(bytes[28] == 1);

        // still decodes to the same grid
        auto decoded = decode_file(r.output_path, ImageFormat::Png);
        REQUIRE(decoded.image.width == 96);
        REQUIRE(decoded.image.height == 64);
        REQUIRE(decoded.image.channels == 4);
    }

    SECTION("lossless without resize") {
        CompressionOptions opts;
        auto r = png.compress(input, opts);
        REQUIRE(r.success);
        auto original = decode_file(input, ImageFormat::Png);
        auto roundtrip = decode_file(r.output_path, ImageFormat::Png);
        REQUIRE(roundtrip.image.pixels == original.image.pixels);
    }

    SECTION("alpha survives a resize") {
        CompressionOptions opts;
        opts.resize_percent = 50;
        auto r = png.compress(input, opts);
        REQUIRE(r.success);
        auto header = probe_file(r.output_path, ImageFormat::Png);
        REQUIRE(header.width == 48);
        REQUIRE(header.height == 32);
        REQUIRE(header.channels == 4);
    }
}

TEST_CASE("Larger output is reported, not hidden", "[compressor]") {
    TempDir dir;
    // stark komprimiertes original, dann mit quality 100 neu kodiert
    auto input = write_jpeg(dir / "tiny.jpg", 128, 128, 5);

    CompressionOptions opts;
    opts.quality = 100;
    opts.chroma_subsample = ChromaSubsample::Yuv444;

    auto r = JpegCompressor{}.compress(input, opts);
    REQUIRE(r.success);
    REQUIRE(r.output_size > r.input_size);
    REQUIRE(r.reduction < 0);
    REQUIRE(r.reduction == calculate_reduction(r.input_size, r.output_size));
}

TEST_CASE("Failures are contained in the result", "[compressor][errors]") {
    TempDir dir;
    JpegCompressor jpeg;
    PngCompressor png;

    SECTION("missing input") {
        auto r = jpeg.compress(dir / "nope.jpg", CompressionOptions{});
        REQUIRE_FALSE(r.success);
        REQUIRE(r.error.has_value());
        REQUIRE(r.error->kind == ErrorKind::InputUnreadable);
        REQUIRE(r.output_path.empty());
    }

    SECTION("corrupt data") {
        auto input = write_garbage(dir / "broken.jpg");
        auto r = jpeg.compress(input, CompressionOptions{});
        REQUIRE_FALSE(r.success);
        REQUIRE(r.error->kind == ErrorKind::DecodeFailed);
        REQUIRE(r.input_size == fs::file_size(input));
        REQUIRE_FALSE(fs::exists(dir / "broken_compressed.jpg"));
    }

    SECTION("empty file") {
        auto input = dir / "empty.png";
        write_bytes(input, {});
        auto r = png.compress(input, CompressionOptions{});
        REQUIRE_FALSE(r.success);
        REQUIRE(r.error->kind == ErrorKind::DecodeFailed);
    }

    SECTION("mismatched extension surfaces at decode") {
        auto input = dir / "really_a_png.jpg";
        write_bytes(input, png_bytes(8, 8));
        auto r = jpeg.compress(input, CompressionOptions{});
        REQUIRE_FALSE(r.success);
        REQUIRE(r.error->kind == ErrorKind::DecodeFailed);
        REQUIRE(r.error->message.find("not jpeg") != std::string::npos);
    }

    SECTION("invalid options") {
        auto input = write_jpeg(dir / "ok.jpg", 8, 8);
        CompressionOptions opts;
        opts.quality = 0;
        auto r = jpeg.compress(input, opts);
        REQUIRE_FALSE(r.success);
        REQUIRE(r.error->kind == ErrorKind::InvalidOptions);
    }

    SECTION("target far beyond the pixel limits") {
        auto input = write_jpeg(dir / "strip.jpg", 2, 1);
        CompressionOptions opts;
        opts.resize_width = 70000;
        auto r = jpeg.compress(input, opts);
        REQUIRE_FALSE(r.success);
        REQUIRE(r.error->kind == ErrorKind::EncodeFailed);
        REQUIRE(r.error->message.find("too large") != std::string::npos);
        REQUIRE_FALSE(fs::exists(dir / "strip_compressed.jpg"));
    }

    SECTION("output directory cannot be created") {
        auto input = write_jpeg(dir / "ok.jpg", 8, 8);
        write_bytes(dir / "blocker", {1});
        CompressionOptions opts;
        opts.output_dir = dir / "blocker" / "sub";
        auto r = jpeg.compress(input, opts);
        REQUIRE_FALSE(r.success);
        REQUIRE(r.error->kind == ErrorKind::DirectoryCreateFailed);
    }
}

TEST_CASE("Missing output directories are created", "[compressor]") {
    TempDir dir;
    auto input = write_png(dir / "in.png", 10, 10);

    CompressionOptions opts;
    opts.output_dir = dir / "nested" / "deeper";
    auto r = PngCompressor{}.compress(input, opts);

    REQUIRE(r.success);
    REQUIRE(r.output_path == dir / "nested" / "deeper" / "in_compressed.png");
    REQUIRE(fs::is_regular_file(r.output_path));
}

TEST_CASE("Image info and estimates", "[compressor]") {
    TempDir dir;
    auto input = write_png(dir / "info.png", 30, 20, 2);

    ImageInfo info = read_image_info(input);
    REQUIRE(info.format == ImageFormat::Png);
    REQUIRE(info.width == 30);
    REQUIRE(info.height == 20);
    REQUIRE(info.color_mode == "gray+alpha");
    REQUIRE(info.size == fs::file_size(input));

    CompressionOptions opts;
    opts.compression_level = 0;
    REQUIRE(PngCompressor{}.estimate_size(input, opts) == info.size);

    REQUIRE_THROWS_AS(read_image_info(dir / "missing.png"), ImageError);
    REQUIRE_THROWS_AS(read_image_info(write_garbage(dir / "bad.png")), ImageError);
}

TEST_CASE("Lanczos resampling", "[compressor][resample]") {

    SECTION("flat colour stays flat") {
        ImageData flat;
        flat.width = 64;
        flat.height = 48;
        flat.channels = 3;
        flat.pixels.assign(static_cast<size_t>(64) * 48 * 3, 128);

        for (Dimensions target : {Dimensions{32, 24}, Dimensions{17, 13}, Dimensions{150, 90}}) {
            ImageData out = resample(flat, target);
            REQUIRE(out.width == target.width);
            REQUIRE(out.height == target.height);
            REQUIRE(out.channels == 3);
            REQUIRE(out.pixels.size() == static_cast<size_t>(target.width) * target.height * 3);
            auto [lo, hi] = std::minmax_element(out.pixels.begin(), out.pixels.end());
            REQUIRE(*lo >= 125);
            REQUIRE(*hi <= 131);
        }
    }

    SECTION("alpha channel survives") {
        ImageData out = resample(make_image(40, 40, 4), {20, 20});
        REQUIRE(out.channels == 4);
        for (size_t i = 3; i < out.pixels.size(); i += 4) {
            REQUIRE(out.pixels[i] >= 250);
        }
    }

    SECTION("targets beyond the pixel limits are refused") {
        ImageData tiny = make_image(2, 2);
        REQUIRE_THROWS_AS(resample(tiny, {70000, 10}), std::runtime_error);
        REQUIRE_THROWS_AS(resample(tiny, {20000, 20000}), std::runtime_error);
        REQUIRE_THROWS_AS(resample(tiny, {0, 10}), std::runtime_error);
    }
}
