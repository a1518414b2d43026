#pragma once
// alle value types die durch die pipeline wandern

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace imgshrink {

enum class ImageFormat {
    Jpeg,
    Png
};

enum class ChromaSubsample {
    Yuv444,
    Yuv422,
    Yuv420
};

// png encoder kennt nur diese vier stufen
enum class PngEffort {
    None,
    Fastest,
    Default,
    Maximum
};

enum class ErrorKind {
    UnsupportedFormat,
    InvalidOptions,
    InputUnreadable,
    DecodeFailed,
    DirectoryCreateFailed,
    EncodeFailed,
    WriteFailed,
    OutputStatFailed
};

const char* to_string(ImageFormat format);
const char* to_string(ChromaSubsample chroma);
const char* to_string(PngEffort effort);
const char* to_string(ErrorKind kind);

std::optional<ChromaSubsample> parse_chroma_subsample(const std::string& text);

// fehler der an einem einzelnen file hängt
struct Error {
    ErrorKind kind = ErrorKind::EncodeFailed;
    std::string message;
};

// thrown by the inspection side of the api (info, estimate, validate, scan)
class ImageError : public std::runtime_error {
public:
    ImageError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

struct JpegParams {
    int quality = 85;
    bool progressive = true;
    ChromaSubsample chroma = ChromaSubsample::Yuv420;
    bool strip_metadata = true;
};

struct PngParams {
    PngEffort effort = PngEffort::Default;
    bool interlaced = false;
};

PngEffort effort_for_level(int compression_level);

struct CompressionOptions {
    int quality = 85;              // 1-100, nur jpeg
    int compression_level = 6;     // 0-9, nur png
    double resize_percent = 0;     // 0 = aus
    int resize_width = 0;          // 0 = auto
    int resize_height = 0;         // 0 = auto
    bool strip_metadata = true;
    bool progressive = true;
    ChromaSubsample chroma_subsample = ChromaSubsample::Yuv420;
    bool interlaced = false;
    std::filesystem::path output_dir;       // leer = neben dem input
    std::string output_suffix = "_compressed";

    JpegParams jpeg() const;
    PngParams png() const;

    bool percent_resize_active() const noexcept {
        return resize_percent > 0 && resize_percent < 100;
    }
};

CompressionOptions default_options();

// returns one message per out-of-range field, empty when valid
std::vector<std::string> validate_options(const CompressionOptions& options);

struct Dimensions {
    int width = 0;
    int height = 0;

    bool operator==(const Dimensions& other) const noexcept {
        return width == other.width && height == other.height;
    }
    bool operator!=(const Dimensions& other) const noexcept { return !(*this == other); }
};

struct ImageInfo {
    std::filesystem::path path;
    ImageFormat format = ImageFormat::Jpeg;
    int width = 0;
    int height = 0;
    std::uintmax_t size = 0;
    std::string color_mode;
};

struct CompressionResult {
    std::filesystem::path input_path;
    std::filesystem::path output_path;
    std::uintmax_t input_size = 0;
    std::uintmax_t output_size = 0;
    int width = 0;
    int height = 0;
    double reduction = 0;
    bool success = false;
    std::optional<Error> error;     // gesetzt genau dann wenn !success
};

struct BatchResult {
    std::vector<CompressionResult> results;     // completion order
    std::uintmax_t total_input = 0;
    std::uintmax_t total_output = 0;
    double total_reduction = 0;
    std::size_t success_count = 0;
    std::size_t fail_count = 0;
};

struct CompressionPreview {
    std::filesystem::path input_path;
    std::uintmax_t input_size = 0;
    std::uintmax_t estimated_size = 0;
    double estimated_reduction = 0;
    ImageFormat format = ImageFormat::Jpeg;
    int width = 0;
    int height = 0;
    int new_width = 0;
    int new_height = 0;
};

// (1 - out/in) * 100, darf negativ sein
double calculate_reduction(std::uintmax_t input_size, std::uintmax_t output_size);

// "1.5 MB" style, 1024er schritte
std::string format_bytes(std::uintmax_t bytes);

} // namespace imgshrink
