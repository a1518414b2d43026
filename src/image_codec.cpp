#include "imgshrink/image_codec.hpp"
#include <algorithm>
#include <cmath>
#include <csetjmp>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <new>

// nur jpeg und png, rest fliegt raus
#define STBI_ONLY_JPEG
#define STBI_ONLY_PNG
// stb braucht die flags sonst isses lahm
#if defined(__SSE2__)
#define STBI_SSE2
#define STBIR_SSE2
#endif

#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_RESIZE_IMPLEMENTATION
#include "stb_image.h"
#include "stb_image_resize2.h"

extern "C" {
#include <jpeglib.h>
}
#include <png.h>

// exif kram damit handyfotos nich auf der seite liegen
#include "exif_orient.hpp"

// mmap ist schneller als fread
#include "mmap_file.hpp"

namespace imgshrink {

namespace {

// Validate dimensions before size calculation to prevent integer overflow
constexpr int MAX_DIMENSION = 65535;
constexpr uint64_t MAX_PIXELS = 100000000;  // 100 megapixels

bool dimensions_sane(int width, int height, int channels) {
    return width > 0 && height > 0 && channels > 0 && channels <= 4 &&
           width <= MAX_DIMENSION && height <= MAX_DIMENSION &&
           static_cast<uint64_t>(width) * static_cast<uint64_t>(height) <= MAX_PIXELS;
}

mmapfile::MappedFile open_input(const std::filesystem::path& path) {
    mmapfile::MappedFile mapped;
    if (!mapped.open(path.string().c_str())) {
        throw ImageError(ErrorKind::InputUnreadable, "cannot read " + path.string());
    }
    return mapped;
}

// stbi_failure_reason ist thread local, kein mutex nötig
std::string stb_reason() {
    const char* reason = stbi_failure_reason();
    return reason ? reason : "unknown";
}

// libjpeg ruft error_exit und erwartet dass wir nie zurückkommen
struct JpegErrorManager {
    jpeg_error_mgr pub;
    jmp_buf jump;
    char message[JMSG_LENGTH_MAX];
};

void jpeg_error_exit(j_common_ptr cinfo) {
    auto* err = reinterpret_cast<JpegErrorManager*>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->message);
    std::longjmp(err->jump, 1);
}

void jpeg_silent_message(j_common_ptr) {}

// was libjpeg für einen durchlauf braucht, alles vom aufrufer allokiert
struct JpegJob {
    int width = 0;
    int height = 0;
    int components = 3;
    JSAMPROW* rows = nullptr;
    const JpegParams* params = nullptr;
    const std::vector<uint8_t>* app1 = nullptr;
};

// Der einzige setjmp frame fürs jpeg encoding. Hier drin wird nach setjmp keine
// lokale variable verändert, buffer und size leben beim aufrufer.
// false wenn libjpeg abgebrochen hat, die meldung steht dann in jerr->message.
bool run_jpeg_compress(jpeg_compress_struct* cinfo, JpegErrorManager* jerr, const JpegJob& job,
                       unsigned char** buffer, unsigned long* buffer_size) {
    cinfo->err = jpeg_std_error(&jerr->pub);
    jerr->pub.error_exit = jpeg_error_exit;
    jerr->pub.output_message = jpeg_silent_message;

    if (setjmp(jerr->jump)) {
        return false;
    }

    jpeg_create_compress(cinfo);
    jpeg_mem_dest(cinfo, buffer, buffer_size);

    cinfo->image_width = static_cast<JDIMENSION>(job.width);
    cinfo->image_height = static_cast<JDIMENSION>(job.height);
    cinfo->input_components = job.components;
    cinfo->in_color_space = job.components == 1 ? JCS_GRAYSCALE : JCS_RGB;

    jpeg_set_defaults(cinfo);
    jpeg_set_quality(cinfo, std::clamp(job.params->quality, 1, 100), TRUE);
    cinfo->optimize_coding = TRUE;

    // luma faktoren bestimmen das subsampling, chroma bleibt 1x1
    if (job.components == 3) {
        switch (job.params->chroma) {
            case ChromaSubsample::Yuv444:
                cinfo->comp_info[0].h_samp_factor = 1;
                cinfo->comp_info[0].v_samp_factor = 1;
                break;
            case ChromaSubsample::Yuv422:
                cinfo->comp_info[0].h_samp_factor = 2;
                cinfo->comp_info[0].v_samp_factor = 1;
                break;
            case ChromaSubsample::Yuv420:
                cinfo->comp_info[0].h_samp_factor = 2;
                cinfo->comp_info[0].v_samp_factor = 2;
                break;
        }
        for (int c = 1; c < 3; ++c) {
            cinfo->comp_info[c].h_samp_factor = 1;
            cinfo->comp_info[c].v_samp_factor = 1;
        }
    }

    if (job.params->progressive) {
        jpeg_simple_progression(cinfo);
    }

    jpeg_start_compress(cinfo, TRUE);

    if (job.app1) {
        jpeg_write_marker(cinfo, JPEG_APP0 + 1, job.app1->data(),
                          static_cast<unsigned int>(job.app1->size()));
    }

    while (cinfo->next_scanline < cinfo->image_height) {
        jpeg_write_scanlines(cinfo, &job.rows[cinfo->next_scanline],
                             cinfo->image_height - cinfo->next_scanline);
    }

    jpeg_finish_compress(cinfo);
    return true;
}

struct PngErrorState {
    char message[256];
};

void png_error_fn(png_structp png, png_const_charp msg) {
    auto* state = static_cast<PngErrorState*>(png_get_error_ptr(png));
    std::snprintf(state->message, sizeof(state->message), "%s", msg ? msg : "libpng error");
    png_longjmp(png, 1);
}

void png_warning_fn(png_structp, png_const_charp) {}

void png_write_to_vector(png_structp png, png_bytep data, png_size_t length) {
    auto* out = static_cast<std::vector<uint8_t>*>(png_get_io_ptr(png));
    out->insert(out->end(), data, data + length);
}

void png_flush_noop(png_structp) {}

// stb schaut selbst auf den inhalt, wir wollen aber dass name und inhalt passen
bool content_matches(const uint8_t* data, size_t size, ImageFormat format) {
    static const uint8_t png_sig[8] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    switch (format) {
        case ImageFormat::Jpeg:
            return size >= 3 && data[0] == 0xFF && data[1] == 0xD8 && data[2] == 0xFF;
        case ImageFormat::Png:
            return size >= 8 && std::memcmp(data, png_sig, 8) == 0;
    }
    return false;
}

// lanczos-3, stb hat nur bis catmull-rom eingebaut
constexpr float kLanczosLobes = 3.0f;
constexpr float kPi = 3.14159265358979f;

float lanczos3_kernel(float x, float, void*) {
    x = std::fabs(x);
    if (x < 1e-6f) return 1.0f;
    if (x >= kLanczosLobes) return 0.0f;
    const float pi_x = kPi * x;
    return kLanczosLobes * std::sin(pi_x) * std::sin(pi_x / kLanczosLobes) / (pi_x * pi_x);
}

float lanczos3_support(float, void*) {
    return kLanczosLobes;
}

void check_encodable(const ImageData& image) {
    if (!dimensions_sane(image.width, image.height, image.channels) ||
        image.pixels.size() != static_cast<size_t>(image.width) * image.height * image.channels) {
        throw ImageError(ErrorKind::EncodeFailed, "pixel buffer does not match its dimensions");
    }
}

} // namespace

std::string color_mode_name(int channels) {
    switch (channels) {
        case 1: return "gray";
        case 2: return "gray+alpha";
        case 3: return "rgb";
        case 4: return "rgba";
        default: return "unknown";
    }
}

DecodedImage decode_memory(const uint8_t* data, size_t size, ImageFormat format) {
    if (!data || size == 0) {
        throw ImageError(ErrorKind::DecodeFailed, "invalid or corrupt image: empty file");
    }
    if (size > static_cast<size_t>(INT32_MAX)) {
        throw ImageError(ErrorKind::DecodeFailed, "invalid or corrupt image: file too large");
    }

    if (!content_matches(data, size, format)) {
        throw ImageError(ErrorKind::DecodeFailed,
                         std::string("invalid or corrupt image: content is not ") + to_string(format));
    }

    int width = 0, height = 0, channels = 0;
    unsigned char* raw = stbi_load_from_memory(data, static_cast<int>(size),
                                               &width, &height, &channels, 0);
    if (!raw) {
        throw ImageError(ErrorKind::DecodeFailed, "invalid or corrupt image: " + stb_reason());
    }

    if (!dimensions_sane(width, height, channels)) {
        stbi_image_free(raw);
        throw ImageError(ErrorKind::DecodeFailed,
                         "invalid or corrupt image: unsupported dimensions " +
                         std::to_string(width) + "x" + std::to_string(height));
    }

    DecodedImage decoded;
    decoded.image.width = width;
    decoded.image.height = height;
    decoded.image.channels = channels;

    // stbi gibt uns nen raw pointer, müssen wir kopieren
    size_t bytes = static_cast<size_t>(width) * static_cast<size_t>(height) * static_cast<size_t>(channels);
    try {
        decoded.image.pixels.assign(raw, raw + bytes);
    } catch (const std::bad_alloc&) {
        stbi_image_free(raw);
        throw;
    }
    stbi_image_free(raw);

    if (format == ImageFormat::Jpeg) {
        decoded.orientation = exif::read_jpeg_orientation(data, size);
        decoded.exif = exif::extract_normalized_app1(data, size);
        exif::apply_orientation(decoded.image.pixels, decoded.image.width, decoded.image.height,
                                decoded.orientation, decoded.image.channels);
    }

    return decoded;
}

DecodedImage decode_file(const std::filesystem::path& path, ImageFormat format) {
    auto mapped = open_input(path);
    return decode_memory(mapped.data(), mapped.size(), format);
}

ImageHeader probe_file(const std::filesystem::path& path, ImageFormat format) {
    auto mapped = open_input(path);
    if (mapped.size() == 0 || mapped.size() > static_cast<size_t>(INT32_MAX)) {
        throw ImageError(ErrorKind::DecodeFailed, "invalid or corrupt image: " + path.string());
    }
    if (!content_matches(mapped.data(), mapped.size(), format)) {
        throw ImageError(ErrorKind::DecodeFailed,
                         std::string("invalid or corrupt image: content is not ") + to_string(format));
    }

    ImageHeader header;
    if (!stbi_info_from_memory(mapped.data(), static_cast<int>(mapped.size()),
                               &header.width, &header.height, &header.channels)) {
        throw ImageError(ErrorKind::DecodeFailed, "invalid or corrupt image: " + stb_reason());
    }

    // gedrehte handyfotos melden die sichtbare größe
    int orientation = exif::read_jpeg_orientation(mapped.data(), mapped.size());
    if (orientation >= 5) {
        std::swap(header.width, header.height);
    }
    return header;
}

ImageData resample(const ImageData& image, Dimensions target) {
    if (target.width <= 0 || target.height <= 0) {
        throw std::runtime_error("resample target must be positive, got " +
                                 std::to_string(target.width) + "x" + std::to_string(target.height));
    }
    if (!dimensions_sane(target.width, target.height, image.channels)) {
        throw std::runtime_error("resample target too large: " + std::to_string(target.width) +
                                 "x" + std::to_string(target.height) + " (max " +
                                 std::to_string(MAX_DIMENSION) + " per side, " +
                                 std::to_string(MAX_PIXELS / 1000000) + " megapixels)");
    }

    ImageData result;
    result.width = target.width;
    result.height = target.height;
    result.channels = image.channels;
    result.pixels.resize(static_cast<size_t>(target.width) * static_cast<size_t>(target.height) *
                         static_cast<size_t>(image.channels));

    // alpha layouts damit transparente kanten nicht dunkel werden
    stbir_pixel_layout layout;
    switch (image.channels) {
        case 1: layout = STBIR_1CHANNEL; break;
        case 2: layout = STBIR_RA; break;
        case 3: layout = STBIR_RGB; break;
        default: layout = STBIR_RGBA; break;
    }

    STBIR_RESIZE resize;
    stbir_resize_init(&resize,
                      image.pixels.data(), image.width, image.height, 0,
                      result.pixels.data(), target.width, target.height, 0,
                      layout, STBIR_TYPE_UINT8_SRGB);
    stbir_set_edgemodes(&resize, STBIR_EDGE_CLAMP, STBIR_EDGE_CLAMP);
    stbir_set_filter_callbacks(&resize, lanczos3_kernel, lanczos3_support,
                               lanczos3_kernel, lanczos3_support);

    if (!stbir_resize_extended(&resize)) {
        throw std::runtime_error("stbir_resize failed for " + std::to_string(target.width) +
                                 "x" + std::to_string(target.height));
    }
    return result;
}

std::vector<uint8_t> encode_jpeg(const ImageData& image, const JpegParams& params,
                                 const std::vector<uint8_t>& exif_app1) {
    check_encodable(image);

    // jpeg kann kein alpha, also wegwerfen
    const bool has_alpha = image.channels == 2 || image.channels == 4;
    const int components = (image.channels <= 2) ? 1 : 3;
    std::vector<uint8_t> opaque;
    const uint8_t* src = image.pixels.data();
    if (has_alpha) {
        size_t count = static_cast<size_t>(image.width) * image.height;
        opaque.resize(count * components);
        for (size_t i = 0; i < count; ++i) {
            std::memcpy(&opaque[i * components], &image.pixels[i * image.channels], components);
        }
        src = opaque.data();
    }

    // alles allokieren bevor setjmp, longjmp ruft keine destruktoren
    const size_t stride = static_cast<size_t>(image.width) * components;
    std::vector<JSAMPROW> rows(image.height);
    for (int y = 0; y < image.height; ++y) {
        rows[y] = const_cast<JSAMPROW>(src + static_cast<size_t>(y) * stride);
    }

    JpegJob job;
    job.width = image.width;
    job.height = image.height;
    job.components = components;
    job.rows = rows.data();
    job.params = &params;
    if (!params.strip_metadata && !exif_app1.empty() && exif_app1.size() <= 65533) {
        job.app1 = &exif_app1;
    }

    jpeg_compress_struct cinfo;
    JpegErrorManager jerr;
    std::memset(&cinfo, 0, sizeof(cinfo));
    std::memset(&jerr, 0, sizeof(jerr));
    unsigned char* buffer = nullptr;
    unsigned long buffer_size = 0;

    const bool ok = run_jpeg_compress(&cinfo, &jerr, job, &buffer, &buffer_size);
    jpeg_destroy_compress(&cinfo);

    if (!ok) {
        std::free(buffer);
        std::string failure = jerr.message[0] ? jerr.message : "libjpeg error";
        throw ImageError(ErrorKind::EncodeFailed, "encode failed: " + failure);
    }

    std::vector<uint8_t> encoded;
    try {
        encoded.assign(buffer, buffer + buffer_size);
    } catch (const std::bad_alloc&) {
        std::free(buffer);
        throw;
    }
    std::free(buffer);
    return encoded;
}

int zlib_level_for(PngEffort effort) {
    switch (effort) {
        case PngEffort::None:    return 0;
        case PngEffort::Fastest: return 1;
        case PngEffort::Default: return 6;
        case PngEffort::Maximum: return 9;
    }
    return 6;
}

std::vector<uint8_t> encode_png(const ImageData& image, const PngParams& params) {
    check_encodable(image);

    int color_type;
    switch (image.channels) {
        case 1: color_type = PNG_COLOR_TYPE_GRAY; break;
        case 2: color_type = PNG_COLOR_TYPE_GRAY_ALPHA; break;
        case 3: color_type = PNG_COLOR_TYPE_RGB; break;
        default: color_type = PNG_COLOR_TYPE_RGBA; break;
    }

    const size_t stride = static_cast<size_t>(image.width) * image.channels;
    std::vector<png_bytep> rows(image.height);
    for (int y = 0; y < image.height; ++y) {
        rows[y] = const_cast<png_bytep>(image.pixels.data() + static_cast<size_t>(y) * stride);
    }
    std::vector<uint8_t> encoded;
    encoded.reserve(image.pixels.size() / 2 + 1024);
    std::string failure;
    PngErrorState state{};

    png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, &state,
                                              png_error_fn, png_warning_fn);
    if (!png) {
        throw ImageError(ErrorKind::EncodeFailed, "encode failed: png_create_write_struct");
    }
    png_infop info = png_create_info_struct(png);
    if (!info) {
        png_destroy_write_struct(&png, nullptr);
        throw ImageError(ErrorKind::EncodeFailed, "encode failed: png_create_info_struct");
    }

    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        failure = state.message[0] ? state.message : "libpng error";
        throw ImageError(ErrorKind::EncodeFailed, "encode failed: " + failure);
    }

    png_set_write_fn(png, &encoded, png_write_to_vector, png_flush_noop);

    png_set_IHDR(png, info,
                 static_cast<png_uint_32>(image.width), static_cast<png_uint_32>(image.height),
                 8, color_type,
                 params.interlaced ? PNG_INTERLACE_ADAM7 : PNG_INTERLACE_NONE,
                 PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);

    png_set_compression_level(png, zlib_level_for(params.effort));
    // ohne kompression bringen filter nix, nur zeit
    if (params.effort == PngEffort::None) {
        png_set_filter(png, PNG_FILTER_TYPE_BASE, PNG_FILTER_NONE);
    } else if (params.effort == PngEffort::Fastest) {
        png_set_filter(png, PNG_FILTER_TYPE_BASE, PNG_FILTER_SUB);
    }

    png_write_info(png, info);
    // png_write_image macht die adam7 passes selbst
    png_write_image(png, rows.data());
    png_write_end(png, nullptr);

    png_destroy_write_struct(&png, &info);
    return encoded;
}

} // namespace imgshrink
