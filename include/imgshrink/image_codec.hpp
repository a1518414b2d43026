#pragma once
// decode / resample / encode, dünne schicht über stb, libjpeg und libpng

#include "imgshrink/types.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace imgshrink {

// interleaved 8-bit pixels, 1-4 channels, no metadata
struct ImageData {
    std::vector<uint8_t> pixels;
    int width = 0;
    int height = 0;
    int channels = 0;

    Dimensions dimensions() const noexcept { return {width, height}; }
};

struct DecodedImage {
    ImageData image;
    int orientation = 1;            // exif wert der schon angewendet wurde
    std::vector<uint8_t> exif;      // APP1 payload, orientation auf 1, leer bei png
};

struct ImageHeader {
    int width = 0;
    int height = 0;
    int channels = 0;
};

// "gray", "gray+alpha", "rgb", "rgba"
std::string color_mode_name(int channels);

// Decodes a file and bakes JPEG EXIF orientation into pixel order.
// Throws ImageError: InputUnreadable when the file cannot be opened,
// DecodeFailed for anything the decoder rejects.
DecodedImage decode_file(const std::filesystem::path& path, ImageFormat format);

// Content has to match the format the name promised, otherwise DecodeFailed.
DecodedImage decode_memory(const uint8_t* data, size_t size, ImageFormat format);

// header only, nix wird dekodiert. Same exceptions as decode_file.
ImageHeader probe_file(const std::filesystem::path& path, ImageFormat format);

// Lanczos-3 resample in sRGB space. Throws std::runtime_error for a target
// beyond the pixel limits or when the resampler gives up.
ImageData resample(const ImageData& image, Dimensions target);

// Both throw ImageError(EncodeFailed) with the codec's message.
std::vector<uint8_t> encode_jpeg(const ImageData& image, const JpegParams& params,
                                 const std::vector<uint8_t>& exif_app1 = {});
std::vector<uint8_t> encode_png(const ImageData& image, const PngParams& params);

// zlib level den libpng für eine stufe bekommt
int zlib_level_for(PngEffort effort);

} // namespace imgshrink
