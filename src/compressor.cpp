#include "imgshrink/compressor.hpp"
#include "imgshrink/format.hpp"
#include "imgshrink/output_path.hpp"
#include "imgshrink/resize.hpp"
#include "imgshrink/size_estimator.hpp"
#include <atomic>
#include <fstream>
#include <new>
#include <string>
#include <system_error>

#include <unistd.h>

namespace imgshrink {

namespace {

CompressionResult& fail(CompressionResult& result, ErrorKind kind, std::string message) {
    result.success = false;
    result.error = Error{kind, std::move(message)};
    return result;
}

// jeder write kriegt sein eigenes temp file, zwei worker können aufs selbe target zielen
std::filesystem::path unique_temp_path(const std::filesystem::path& target) {
    static std::atomic<unsigned long> counter{0};
    auto temp_path = target;
    temp_path += "." + std::to_string(::getpid()) + "." + std::to_string(counter++) + ".tmp";
    return temp_path;
}

// ATOMIC WRITE: erst temp file, dann rename. kein halbes output bei crash oder voller platte
bool write_atomically(const std::filesystem::path& target, const std::vector<uint8_t>& bytes,
                      std::string& error) {
    auto temp_path = unique_temp_path(target);

    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            error = "cannot open " + temp_path.string() + " for writing";
            return false;
        }
        out.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
        out.close();
        if (!out) {
            std::error_code rm_ec;
            std::filesystem::remove(temp_path, rm_ec);
            error = "short write to " + temp_path.string();
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, target, ec);
    if (ec) {
        std::error_code rm_ec;
        std::filesystem::remove(temp_path, rm_ec);
        error = "cannot move output into place: " + ec.message();
        return false;
    }
    return true;
}

} // namespace

ImageInfo read_image_info(const std::filesystem::path& path) {
    ImageFormat format = resolve_format(path);

    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw ImageError(ErrorKind::InputUnreadable,
                         "failed to stat " + path.string() + ": " + ec.message());
    }

    ImageHeader header = probe_file(path, format);

    ImageInfo info;
    info.path = path;
    info.format = format;
    info.width = header.width;
    info.height = header.height;
    info.size = size;
    info.color_mode = color_mode_name(header.channels);
    return info;
}

CompressionResult Compressor::compress(const std::filesystem::path& input,
                                       const CompressionOptions& options) const {
    CompressionResult result;
    result.input_path = input;

    auto problems = validate_options(options);
    if (!problems.empty()) {
        return fail(result, ErrorKind::InvalidOptions, problems.front());
    }

    // original größe für stats
    std::error_code ec;
    result.input_size = std::filesystem::file_size(input, ec);
    if (ec) {
        result.input_size = 0;
        return fail(result, ErrorKind::InputUnreadable,
                    "input unreadable: " + input.string() + ": " + ec.message());
    }

    DecodedImage decoded;
    try {
        decoded = decode_file(input, format());
    } catch (const ImageError& e) {
        return fail(result, e.kind(), e.what());
    } catch (const std::bad_alloc&) {
        return fail(result, ErrorKind::DecodeFailed, "invalid or corrupt image: out of memory");
    }

    // resize nur wenn sich was ändert, sonst verlieren wir qualität umsonst
    ImageData resized;
    const ImageData* image = &decoded.image;
    try {
        Dimensions target = compute_target_dimensions(decoded.image.dimensions(), options);
        if (target != decoded.image.dimensions()) {
            resized = resample(decoded.image, target);
            image = &resized;
        }
    } catch (const std::bad_alloc&) {
        return fail(result, ErrorKind::EncodeFailed, "resample failed: out of memory");
    } catch (const std::exception& e) {
        return fail(result, ErrorKind::EncodeFailed, std::string("resample failed: ") + e.what());
    }

    result.width = image->width;
    result.height = image->height;

    result.output_path = generate_output_path(input, options);

    auto out_dir = result.output_path.parent_path();
    if (!out_dir.empty() && !std::filesystem::is_directory(out_dir, ec)) {
        std::filesystem::create_directories(out_dir, ec);
        if (ec) {
            return fail(result, ErrorKind::DirectoryCreateFailed,
                        "cannot create " + out_dir.string() + ": " + ec.message());
        }
    }

    std::vector<uint8_t> encoded;
    try {
        encoded = encode(decoded, *image, options);
    } catch (const ImageError& e) {
        return fail(result, ErrorKind::EncodeFailed, e.what());
    } catch (const std::bad_alloc&) {
        return fail(result, ErrorKind::EncodeFailed, "encode failed: out of memory");
    }

    std::string write_error;
    if (!write_atomically(result.output_path, encoded, write_error)) {
        return fail(result, ErrorKind::WriteFailed, write_error);
    }

    // gemessen, nicht encoded.size() - was auf der platte liegt zählt
    result.output_size = std::filesystem::file_size(result.output_path, ec);
    if (ec) {
        result.output_size = 0;
        return fail(result, ErrorKind::OutputStatFailed,
                    "cannot stat " + result.output_path.string() + ": " + ec.message());
    }

    // größer als vorher ist ein echtes ergebnis, wird nicht versteckt
    result.reduction = calculate_reduction(result.input_size, result.output_size);
    result.success = true;
    result.error.reset();
    return result;
}

std::uintmax_t Compressor::estimate_size(const std::filesystem::path& input,
                                         const CompressionOptions& options) const {
    ImageInfo info = read_image_info(input);
    return imgshrink::estimate_size(format(), info.size, options);
}

std::vector<uint8_t> JpegCompressor::encode(const DecodedImage& source, const ImageData& image,
                                            const CompressionOptions& options) const {
    return encode_jpeg(image, options.jpeg(), source.exif);
}

std::vector<uint8_t> PngCompressor::encode(const DecodedImage&, const ImageData& image,
                                           const CompressionOptions& options) const {
    return encode_png(image, options.png());
}

} // namespace imgshrink
