#pragma once
// ein file rein, ein CompressionResult raus

#include "imgshrink/image_codec.hpp"
#include "imgshrink/types.hpp"
#include <cstdint>
#include <filesystem>
#include <vector>

namespace imgshrink {

// Fresh header snapshot of a supported image file.
// Throws ImageError (UnsupportedFormat, InputUnreadable, DecodeFailed).
ImageInfo read_image_info(const std::filesystem::path& path);

// Shared decode -> resize -> encode -> write -> measure pipeline. Subclasses
// only provide the format and the encoder call.
class Compressor {
public:
    virtual ~Compressor() = default;

    virtual ImageFormat format() const noexcept = 0;

    // Never throws; every failure ends up in result.error.
    CompressionResult compress(const std::filesystem::path& input,
                               const CompressionOptions& options) const;

    // Header-validated heuristic, throws ImageError like read_image_info.
    std::uintmax_t estimate_size(const std::filesystem::path& input,
                                 const CompressionOptions& options) const;

protected:
    virtual std::vector<uint8_t> encode(const DecodedImage& source, const ImageData& image,
                                        const CompressionOptions& options) const = 0;
};

class JpegCompressor final : public Compressor {
public:
    ImageFormat format() const noexcept override { return ImageFormat::Jpeg; }

protected:
    std::vector<uint8_t> encode(const DecodedImage& source, const ImageData& image,
                                const CompressionOptions& options) const override;
};

class PngCompressor final : public Compressor {
public:
    ImageFormat format() const noexcept override { return ImageFormat::Png; }

protected:
    std::vector<uint8_t> encode(const DecodedImage& source, const ImageData& image,
                                const CompressionOptions& options) const override;
};

} // namespace imgshrink
