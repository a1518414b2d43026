#include "imgshrink/cli.hpp"
#include "imgshrink/api.hpp"
#include "imgshrink/format.hpp"
#include "imgshrink/progress_queue.hpp"
#include <chrono>
#include <iomanip>
#include <iostream>
#include <thread>

#ifndef IMGSHRINK_VERSION
#define IMGSHRINK_VERSION "1.0.0"
#endif

namespace imgshrink {

namespace {

// zahl parsen, false wenn müll drinsteht
template<typename T, typename Conv>
bool parse_number(const std::string& text, T& out, Conv conv) {
    try {
        size_t consumed = 0;
        out = conv(text, &consumed);
        return consumed == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

bool parse_int(const std::string& text, int& out) {
    return parse_number(text, out, [](const std::string& s, size_t* n) { return std::stoi(s, n); });
}

bool parse_double(const std::string& text, double& out) {
    return parse_number(text, out, [](const std::string& s, size_t* n) { return std::stod(s, n); });
}

} // namespace

void CLI::print_version() {
    std::cout << "imgshrink " << IMGSHRINK_VERSION << "\n";
    std::cout << "Batch JPEG/PNG re-encoder\n";
}

void CLI::print_help() {
    std::cout << "imgshrink " << IMGSHRINK_VERSION << R"(

  Re-encode JPEG and PNG files smaller, optionally resized.

USAGE
  imgshrink <input>... [options]

EXAMPLES
  imgshrink photo.jpg                   Writes photo_compressed.jpg next to it
  imgshrink photos/ -r -o small/        Whole tree into small/
  imgshrink photos/ -q 70 -w 1920       Quality 70, 1920px wide
  imgshrink shot.png -l 9 --estimate    Preview only, nothing is written

OPTIONS
  -o, --output <dir>       Output directory (default: next to each input)
  -s, --suffix <text>      Inserted before the extension (default: _compressed)
  -q, --quality <1-100>    JPEG quality (default: 85)
  -l, --level <0-9>        PNG compression level (default: 6)
  -p, --percent <0-100>    Resize by percent, wins over -w/-h
  -w, --width <pixels>     Target width, height follows unless -h is given
  -h, --height <pixels>    Target height, width follows unless -w is given
      --chroma <mode>      JPEG chroma subsampling 4:4:4, 4:2:2, 4:2:0 (default: 4:2:0)
      --baseline           Baseline instead of progressive JPEG
      --interlace          Adam7 interlaced PNG
      --keep-metadata      Carry JPEG EXIF over to the output
  -r, --recursive          Descend into sub directories
      --estimate           Print size estimates instead of compressing
      --info               Print image information only
  -v, --verbose            One line per file
  -H, --help               Show this help message
      --version            Show version number

)";
}

std::optional<CLIConfig> CLI::parse(int argc, char* argv[], int& exit_code) {
    exit_code = 1;
    if (argc < 2) {
        print_help();
        return std::nullopt;
    }

    CLIConfig config;
    CompressionOptions& opts = config.options;

    auto need_value = [&](int& i, const std::string& arg, const char* what) -> const char* {
        if (++i >= argc) {
            std::cerr << "Error: " << arg << " requires " << what << "\n";
            return nullptr;
        }
        return argv[i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-H") {
            print_help();
            exit_code = 0;
            return std::nullopt;
        }
        else if (arg == "--version") {
            print_version();
            exit_code = 0;
            return std::nullopt;
        }
        else if (arg == "-o" || arg == "--output") {
            const char* v = need_value(i, arg, "a directory");
            if (!v) return std::nullopt;
            opts.output_dir = v;
        }
        else if (arg == "-s" || arg == "--suffix") {
            const char* v = need_value(i, arg, "a suffix");
            if (!v) return std::nullopt;
            opts.output_suffix = v;
        }
        else if (arg == "-q" || arg == "--quality") {
            const char* v = need_value(i, arg, "a number (1-100)");
            if (!v) return std::nullopt;
            if (!parse_int(v, opts.quality)) {
                std::cerr << "Error: Invalid quality value\n";
                return std::nullopt;
            }
        }
        else if (arg == "-l" || arg == "--level") {
            const char* v = need_value(i, arg, "a number (0-9)");
            if (!v) return std::nullopt;
            if (!parse_int(v, opts.compression_level)) {
                std::cerr << "Error: Invalid compression level\n";
                return std::nullopt;
            }
        }
        else if (arg == "-p" || arg == "--percent") {
            const char* v = need_value(i, arg, "a percentage");
            if (!v) return std::nullopt;
            if (!parse_double(v, opts.resize_percent)) {
                std::cerr << "Error: Invalid resize percentage\n";
                return std::nullopt;
            }
        }
        else if (arg == "-w" || arg == "--width") {
            const char* v = need_value(i, arg, "a width in pixels");
            if (!v) return std::nullopt;
            if (!parse_int(v, opts.resize_width)) {
                std::cerr << "Error: Invalid width value\n";
                return std::nullopt;
            }
        }
        else if (arg == "-h" || arg == "--height") {
            const char* v = need_value(i, arg, "a height in pixels");
            if (!v) return std::nullopt;
            if (!parse_int(v, opts.resize_height)) {
                std::cerr << "Error: Invalid height value\n";
                return std::nullopt;
            }
        }
        else if (arg == "--chroma") {
            const char* v = need_value(i, arg, "4:4:4, 4:2:2 or 4:2:0");
            if (!v) return std::nullopt;
            auto chroma = parse_chroma_subsample(v);
            if (!chroma) {
                std::cerr << "Error: Unknown chroma subsampling '" << v << "'\n";
                return std::nullopt;
            }
            opts.chroma_subsample = *chroma;
        }
        else if (arg == "--baseline") {
            opts.progressive = false;
        }
        else if (arg == "--interlace") {
            opts.interlaced = true;
        }
        else if (arg == "--keep-metadata") {
            opts.strip_metadata = false;
        }
        else if (arg == "-r" || arg == "--recursive") {
            config.recursive = true;
        }
        else if (arg == "--estimate") {
            config.mode = CliMode::Estimate;
        }
        else if (arg == "--info") {
            config.mode = CliMode::Info;
        }
        else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        }
        else if (!arg.empty() && arg[0] != '-') {
            config.input_paths.emplace_back(arg);
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::cerr << "Use 'imgshrink --help' for usage information.\n";
            return std::nullopt;
        }
    }

    if (config.input_paths.empty()) {
        std::cerr << "Error: No input files specified\n";
        std::cerr << "Use 'imgshrink --help' for usage information.\n";
        return std::nullopt;
    }

    auto problems = validate_options(opts);
    if (!problems.empty()) {
        for (const auto& p : problems) {
            std::cerr << "Error: " << p << "\n";
        }
        return std::nullopt;
    }

    return config;
}

std::vector<std::filesystem::path> CLI::collect_files(
    const ImageApi& api,
    const std::vector<std::filesystem::path>& paths,
    bool recursive
) {
    std::vector<std::filesystem::path> files;

    for (const auto& path : paths) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            std::cerr << "Warning: " << path << " does not exist, skipping\n";
            continue;
        }

        if (std::filesystem::is_directory(path, ec)) {
            try {
                auto found = api.scan_directory(path, recursive);
                files.insert(files.end(), found.begin(), found.end());
            } catch (const ImageError& e) {
                std::cerr << "Warning: " << e.what() << "\n";
            }
        } else if (is_supported(path)) {
            files.push_back(path);
        } else {
            std::cerr << "Warning: " << path << " is not a supported image format\n";
        }
    }

    return files;
}

int CLI::run_info(const ImageApi& api, const std::vector<std::filesystem::path>& files) {
    size_t failures = 0;
    for (const auto& file : files) {
        try {
            ImageInfo info = api.get_info(file);
            std::cout << info.path.string() << ": " << to_string(info.format) << " "
                      << info.width << "x" << info.height << " " << info.color_mode
                      << ", " << format_bytes(info.size) << "\n";
        } catch (const ImageError& e) {
            failures++;
            std::cerr << "FAILED: " << file.string() << " - " << e.what() << "\n";
        }
    }
    if (failures == files.size()) return 2;
    return failures > 0 ? 1 : 0;
}

int CLI::run_estimate(const ImageApi& api, const std::vector<std::filesystem::path>& files,
                      const CompressionOptions& options) {
    size_t failures = 0;
    for (const auto& file : files) {
        try {
            CompressionPreview p = api.preview(file, options);
            std::cout << p.input_path.string() << ": " << p.width << "x" << p.height;
            if (p.new_width != p.width || p.new_height != p.height) {
                std::cout << " -> " << p.new_width << "x" << p.new_height;
            }
            std::cout << ", " << format_bytes(p.input_size) << " -> ~"
                      << format_bytes(p.estimated_size) << " (~" << std::fixed
                      << std::setprecision(0) << p.estimated_reduction << "% smaller)\n";
        } catch (const ImageError& e) {
            failures++;
            std::cerr << "FAILED: " << file.string() << " - " << e.what() << "\n";
        }
    }
    if (failures == files.size()) return 2;
    return failures > 0 ? 1 : 0;
}

void CLI::print_summary(const BatchResult& batch, double total_time_ms) {
    std::cout << "\n";
    std::cout << "Done! " << batch.success_count << " images compressed";
    if (batch.fail_count > 0) {
        std::cout << ", " << batch.fail_count << " failed";
    }
    std::cout << " in " << std::fixed << std::setprecision(1) << total_time_ms / 1000.0 << "s\n";

    std::cout << "  " << format_bytes(batch.total_input) << " -> " << format_bytes(batch.total_output);
    if (batch.total_input > 0) {
        if (batch.total_reduction >= 0) {
            std::cout << " (" << std::fixed << std::setprecision(1) << batch.total_reduction << "% smaller)";
        } else {
            std::cout << " (" << std::fixed << std::setprecision(1) << -batch.total_reduction << "% larger)";
        }
    }
    std::cout << "\n";
}

int CLI::run(const CLIConfig& config) {
    ImageApi api;

    // files sammeln
    auto files = collect_files(api, config.input_paths, config.recursive);

    if (files.empty()) {
        std::cerr << "No supported images found.\n";
        std::cerr << "Supported formats: .jpg .jpeg .png\n";
        return 1;
    }

    if (config.mode == CliMode::Info) {
        return run_info(api, files);
    }
    if (config.mode == CliMode::Estimate) {
        return run_estimate(api, files, config.options);
    }

    std::cout << "Compressing " << files.size() << " image(s), "
              << kMaxInFlight << " at a time...\n";

    // progress läuft auf eigenem thread, die worker pushen nur
    ProgressQueue progress;
    const size_t total = files.size();
    std::thread printer([&progress, total, verbose = config.verbose]() {
        size_t done = 0;
        while (auto result = progress.pop()) {
            done++;
            if (verbose) {
                std::cout << "[" << done << "/" << total << "] "
                          << result->input_path.filename().string();
                if (result->success) {
                    std::cout << " -> " << result->output_path.filename().string() << " "
                              << result->width << "x" << result->height << ", "
                              << std::fixed << std::setprecision(1) << result->reduction << "% saved\n";
                } else {
                    std::cout << " FAILED: " << result->error->message << "\n";
                }
            } else if (done % 10 == 0 || done == total) {
                // minimal progress: nur alle 10 files oder am ende updaten
                std::cout << "\r" << done << "/" << total << " processed..." << std::flush;
            }
        }
    });

    auto start_time = std::chrono::steady_clock::now();
    BatchResult batch;
    try {
        batch = api.batch_compress(files, config.options, &progress);
    } catch (const std::exception&) {
        progress.close();
        printer.join();
        throw;
    }
    auto end_time = std::chrono::steady_clock::now();

    progress.close();
    printer.join();

    double total_time = std::chrono::duration<double, std::milli>(end_time - start_time).count();

    // errors am ende zeigen wenn nich verbose
    if (!config.verbose) {
        std::cout << "\n";
        for (const auto& r : batch.results) {
            if (!r.success) {
                std::cerr << "FAILED: " << r.input_path.filename().string() << " - "
                          << r.error->message << "\n";
            }
        }
    }

    print_summary(batch, total_time);

    if (batch.fail_count == batch.results.size()) return 2;  // All failed
    if (batch.fail_count > 0) return 1;                       // Partial failure
    return 0;
}

} // namespace imgshrink
