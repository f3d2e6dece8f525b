/**
 * @file cli.cpp
 * @brief palraw command line interface.
 *
 * Inspects, exports, marks and re-labels activPAL raw data files.
 */

#include <palraw/palraw.hpp>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <string>
#include <vector>

using namespace palraw;

static void print_version() {
    std::printf("palraw %s\n", version());
}

static void print_help(const char* prog_name) {
    std::printf("activPAL raw data tools (v%s)\n", version());
    std::printf("==============================\n\n");
    std::printf("Usage:\n");
    std::printf("  %s info <file>\n", prog_name);
    std::printf("  %s export <file> [output.csv]\n", prog_name);
    std::printf("  %s set-code <file> <code>\n", prog_name);
    std::printf("  %s mark <file> <sample> <marks.csv> [confidence]\n\n", prog_name);
    std::printf("Options:\n");
    std::printf("  -h, --help     Show this help message\n");
    std::printf("  -v, --version  Show version information\n\n");
    std::printf("Commands:\n");
    std::printf("  info           Print header metadata and decoded sample count\n");
    std::printf("  export         Write DateTime,x,y,z,rss (g) to CSV\n");
    std::printf("                 (default output: <file>.csv)\n");
    std::printf("  set-code       Overwrite the file code (up to 8 characters)\n");
    std::printf("  mark           Snap <sample> to the nearest magnitude peak and\n");
    std::printf("                 append it to <marks.csv> with optional confidence 1-10\n\n");
    std::printf("Files:\n");
    std::printf("  .dat           1023-byte header\n");
    std::printf("  .datx          1024-byte header\n\n");
    std::printf("Examples:\n");
    std::printf("  %s info subject01.datx\n", prog_name);
    std::printf("  %s set-code subject01.datx S01\n", prog_name);
    std::printf("  %s mark subject01.datx 36000 marks.csv 8\n\n", prog_name);
}

static bool parse_size(const char* text, std::size_t& value) {
    char* end = nullptr;
    unsigned long long parsed = std::strtoull(text, &end, 10);
    if (end == text || *end != '\0' || text[0] == '-') {
        return false;
    }
    value = static_cast<std::size_t>(parsed);
    return true;
}

template <typename T> static std::string optional_text(const std::optional<T>& value) {
    return value ? std::to_string(*value) : std::string("None");
}

template <typename E> static const char* condition_text(const std::optional<E>& value) {
    return value ? to_string(*value) : "None";
}

static int do_info(const char* input_path) {
    Metadata meta;
    std::vector<RawSample> samples;
    auto result = load_raw(input_path, meta, samples);
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: %s: %s\n", error_string(result), input_path);
        return 1;
    }

    std::printf("File:            %s\n", input_path);
    std::printf("Firmware:        %d\n", meta.firmware);
    std::printf("Bit depth:       %d\n", meta.bitdepth);
    std::printf("Resolution (g):  %s\n", optional_text(meta.resolution).c_str());
    std::printf("Sample rate:     %d Hz\n", meta.hz);
    std::printf("Axes:            %s\n", optional_text(meta.axes).c_str());
    std::printf("Start:           %s\n", format_timestamp(Timestamp{meta.start_datetime}).c_str());
    std::printf("Stop:            %s\n", format_timestamp(Timestamp{meta.stop_datetime}).c_str());
    std::printf("Duration:        %s\n", format_duration(meta.duration).c_str());
    std::printf("Start condition: %s\n", condition_text(meta.start_condition));
    std::printf("Stop condition:  %s\n", condition_text(meta.stop_condition));
    std::printf("File code:       %s\n", meta.file_code.c_str());
    std::printf("Device id:       %d\n", meta.device_id);
    std::printf("Samples:         %zu\n", samples.size());

    return 0;
}

static int do_export(const char* input_path, const std::string& output_path) {
    Recording rec;
    auto status = Recording::load(input_path, rec);
    if (status != Error::Ok) {
        std::fprintf(stderr, "Error: %s: %s\n", error_string(status), input_path);
        return 1;
    }

    std::ofstream out(output_path);
    if (!out) {
        std::fprintf(stderr, "Error: Cannot write output file: %s\n", output_path.c_str());
        return 1;
    }

    const auto x = rec.x();
    const auto y = rec.y();
    const auto z = rec.z();
    const auto rss = rec.rss();

    char line[64];
    out << "DateTime,x,y,z,rss\n";
    for (std::size_t i = 0; i < rec.size(); ++i) {
        std::snprintf(line, sizeof(line), ",%.6f,%.6f,%.6f,%.6f\n", x[i], y[i], z[i], rss[i]);
        out << format_timestamp(rec.timestamp(i)) << line;
    }

    out.flush();
    if (!out) {
        std::fprintf(stderr, "Error: Cannot write output file: %s\n", output_path.c_str());
        return 1;
    }

    std::printf("Input:       %s (%zu samples at %d Hz)\n", input_path, rec.size(),
                rec.metadata().hz);
    std::printf("Output:      %s\n", output_path.c_str());

    return 0;
}

static int do_set_code(const char* input_path, const char* code) {
    auto result = set_file_code(input_path, code);
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: %s: %s\n", error_string(result), input_path);
        return 1;
    }

    std::printf("File code of %s set to \"%s\"\n", input_path, code);
    return 0;
}

static int do_mark(const char* input_path, std::size_t sample, const char* csv_path,
                   std::optional<int> confidence) {
    Recording rec;
    auto status = Recording::load(input_path, rec);
    if (status != Error::Ok) {
        std::fprintf(stderr, "Error: %s: %s\n", error_string(status), input_path);
        return 1;
    }

    const auto rss = rec.rss();
    std::size_t peak = 0;
    status = nearest_peak(rss.data(), rss.size(), sample, peak);
    if (status != Error::Ok) {
        std::fprintf(stderr, "Error: Sample %zu out of range (%zu samples)\n", sample,
                     rec.size());
        return 1;
    }

    Mark mark;
    mark.file = input_path;
    mark.sample = peak;
    mark.timestamp = rec.timestamp(peak);
    mark.confidence = confidence;

    status = append_mark(csv_path, mark);
    if (status != Error::Ok) {
        std::fprintf(stderr, "Error: %s: %s\n", error_string(status), csv_path);
        return 1;
    }

    std::printf("Marked:      sample %zu (%s)\n", peak, format_timestamp(mark.timestamp).c_str());
    std::printf("Output:      %s\n", csv_path);
    return 0;
}

static int run(int argc, char** argv) {
    const char* command = argv[1];

    if (std::strcmp(command, "info") == 0) {
        if (argc != 3) {
            std::fprintf(stderr, "Usage: %s info <file>\n", argv[0]);
            return 1;
        }
        return do_info(argv[2]);
    }

    if (std::strcmp(command, "export") == 0) {
        if (argc != 3 && argc != 4) {
            std::fprintf(stderr, "Usage: %s export <file> [output.csv]\n", argv[0]);
            return 1;
        }
        std::string output_path = (argc == 4) ? argv[3] : std::string(argv[2]) + ".csv";
        return do_export(argv[2], output_path);
    }

    if (std::strcmp(command, "set-code") == 0) {
        if (argc != 4) {
            std::fprintf(stderr, "Usage: %s set-code <file> <code>\n", argv[0]);
            return 1;
        }
        return do_set_code(argv[2], argv[3]);
    }

    if (std::strcmp(command, "mark") == 0) {
        if (argc != 5 && argc != 6) {
            std::fprintf(stderr, "Usage: %s mark <file> <sample> <marks.csv> [confidence]\n",
                         argv[0]);
            return 1;
        }

        std::size_t sample = 0;
        if (!parse_size(argv[3], sample)) {
            std::fprintf(stderr, "Error: sample must be a non-negative integer\n");
            return 1;
        }

        std::optional<int> confidence;
        if (argc == 6) {
            int value = std::atoi(argv[5]);
            if (value < MIN_CONFIDENCE || value > MAX_CONFIDENCE) {
                std::fprintf(stderr, "Error: confidence must be 1-10\n");
                return 1;
            }
            confidence = value;
        }

        return do_mark(argv[2], sample, argv[4], confidence);
    }

    std::fprintf(stderr, "Error: Unknown command: %s\n", command);
    std::fprintf(stderr, "Run %s --help for usage\n", argv[0]);
    return 1;
}

int main(int argc, char** argv) {
    // Check for help flag
    if (argc < 2 || std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        print_help(argv[0]);
        return (argc < 2) ? 1 : 0;
    }

    // Check for version flag
    if (std::strcmp(argv[1], "-v") == 0 || std::strcmp(argv[1], "--version") == 0) {
        print_version();
        return 0;
    }

    return run(argc, argv);
}
