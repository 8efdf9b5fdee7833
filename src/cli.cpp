/**
 * @file cli.cpp
 * @brief biofile command line interface.
 *
 * Offline inspection of .bio recordings: a header summary that also
 * tells complete files from truncated ones, and CSV export of a single
 * entry for external plotting.
 */

#include <biofile/biofile.hpp>

#include <cinttypes>
#include <cstdio>
#include <cstring>
#include <string>

using namespace biofile;

static void print_version() {
    std::printf("biofile %s (C++)\n", version());
}

static void print_help(const char* prog_name) {
    std::printf("\nbiofile %s: .bio signal container tool\n", version());
    std::printf("===========================================\n\n");
    std::printf("Usage:\n");
    std::printf("  %s info <file.bio>\n", prog_name);
    std::printf("  %s export <file.bio> <signal> [output.csv]\n\n", prog_name);
    std::printf("Options:\n");
    std::printf("  -h, --help     Show this help message\n");
    std::printf("  -v, --version  Show version information\n\n");
    std::printf("Commands:\n");
    std::printf("  info           Print the header and check the file size against it\n");
    std::printf("  export         Write one entry (signal, timestamp or trigger) as CSV\n\n");
    std::printf("Output:\n");
    std::printf("  export:  <output.csv>, or <file.bio>.<signal>.csv if omitted\n\n");
    std::printf("Examples:\n");
    std::printf("  %s info session.bio\n", prog_name);
    std::printf("  %s export session.bio emg emg.csv\n\n", prog_name);
}

static int do_info(const char* input_path) {
    Header header;
    std::uint64_t file_size = 0;
    auto result = read_file_header(input_path, header, file_size);
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: %s: %s\n", input_path, error_string(result));
        return 1;
    }

    std::printf("File:        %s (%" PRIu64 " bytes)\n", input_path, file_size);
    std::printf("Base rate:   %g Hz\n", static_cast<double>(header.base_sampling_rate));
    std::printf("Timestamps:  %" PRIu32 " samples\n", header.base_sample_count);
    std::printf("Trigger:     %s\n", header.has_trigger ? "yes" : "no");
    std::printf("Signals:     %zu\n", header.signals.size());

    for (const auto& descriptor : header.signals) {
        std::printf("  %-20s %10g Hz  %8" PRIu32 " x %-4" PRIu32 " %s\n", descriptor.name.c_str(),
                    static_cast<double>(descriptor.sampling_rate), descriptor.sample_count,
                    descriptor.channel_count, type_name(descriptor.type));
    }

    std::uint64_t expected = header.file_size();
    const char* status = "complete";
    if (file_size < expected) {
        status = "truncated";
    } else if (file_size > expected) {
        status = "trailing bytes";
    }
    std::printf("Expected:    %" PRIu64 " bytes\n", expected);
    std::printf("Status:      %s\n", status);

    return file_size < expected ? 1 : 0;
}

static int do_export(const char* input_path, const char* signal_name, const std::string& output_path) {
    Container container;
    auto result = read_file(input_path, container);
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: %s: %s\n", input_path, error_string(result));
        return 1;
    }

    const Signal* signal = container.find(signal_name);
    if (signal == nullptr) {
        std::fprintf(stderr, "Error: No entry named '%s' in %s\n", signal_name, input_path);
        return 1;
    }

    std::FILE* out = std::fopen(output_path.c_str(), "w");
    if (out == nullptr) {
        std::fprintf(stderr, "Error: Cannot write output file: %s\n", output_path.c_str());
        return 1;
    }

    const SignalMatrix& data = signal->data;
    const double rate = static_cast<double>(signal->sampling_rate);

    std::fprintf(out, "time");
    for (std::size_t c = 0; c < data.cols(); ++c) {
        std::fprintf(out, ",ch%zu", c);
    }
    std::fprintf(out, "\n");

    for (std::size_t r = 0; r < data.rows(); ++r) {
        std::fprintf(out, "%.9g", static_cast<double>(r) / rate);
        for (std::size_t c = 0; c < data.cols(); ++c) {
            std::fprintf(out, ",%.17g", data.as_double(r, c));
        }
        std::fprintf(out, "\n");
    }

    bool failed = std::ferror(out) != 0;
    if (std::fclose(out) != 0 || failed) {
        std::fprintf(stderr, "Error: Cannot write output file: %s\n", output_path.c_str());
        return 1;
    }

    std::printf("Input:       %s\n", input_path);
    std::printf("Output:      %s (%zu rows, %zu channels)\n", output_path.c_str(), data.rows(),
                data.cols());
    return 0;
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

    if (std::strcmp(argv[1], "info") == 0) {
        if (argc != 3) {
            std::fprintf(stderr, "Error: info requires 1 argument\n");
            std::fprintf(stderr, "Usage: %s info <file.bio>\n", argv[0]);
            return 1;
        }
        return do_info(argv[2]);
    }

    if (std::strcmp(argv[1], "export") == 0) {
        if (argc != 4 && argc != 5) {
            std::fprintf(stderr, "Error: export requires 2 or 3 arguments\n");
            std::fprintf(stderr, "Usage: %s export <file.bio> <signal> [output.csv]\n", argv[0]);
            return 1;
        }

        std::string output_path =
            (argc == 5) ? std::string(argv[4]) : std::string(argv[2]) + "." + argv[3] + ".csv";
        return do_export(argv[2], argv[3], output_path);
    }

    std::fprintf(stderr, "Error: Unknown command: %s\n", argv[1]);
    std::fprintf(stderr, "Run '%s --help' for usage\n", argv[0]);
    return 1;
}
