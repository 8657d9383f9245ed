/**
 * @file cli.cpp
 * @brief ubjson-encode command line interface.
 *
 * Encodes the lines of a text file as one UBJSON array of strings
 * (optionally numbers), streaming each line out as soon as it is read.
 */

#include <ubjson/ubjson.hpp>

#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <string>
#include <system_error>

using namespace ubjson;

static void print_version() {
    std::printf("ubjson-encode %s (C++)\n", version());
}

static void print_help(const char* prog_name) {
    std::printf("\nUBJSON line encoder (v%s C++)\n", version());
    std::printf("==============================\n\n");
    std::printf("Usage:\n");
    std::printf("  %s [-n] [-s] [-o <output>] [<input>]\n\n", prog_name);
    std::printf("Options:\n");
    std::printf("  -n             Encode lines that parse as numbers as numbers\n");
    std::printf("  -s             Write a sized array (reads all lines first)\n");
    std::printf("  -o <output>    Output file\n");
    std::printf("  -h, --help     Show this help message\n");
    std::printf("  -v, --version  Show version information\n\n");
    std::printf("Output:\n");
    std::printf("  <output> if given, else <input>.ubj, else stdout when reading stdin\n\n");
    std::printf("Examples:\n");
    std::printf("  %s names.txt                # unsized array of strings\n", prog_name);
    std::printf("  %s -n -s samples.txt        # sized array of numbers\n", prog_name);
    std::printf("  seq 10 | %s -n -o seq.ubj   # from stdin\n\n", prog_name);
}

/**
 * @brief Convert one input line into a value.
 */
static Value line_to_value(const std::string& line, bool numbers) {
    if (!numbers || line.empty()) {
        return Value(line);
    }

    if (auto integer = Integer::parse(line)) {
        return Value(std::move(*integer));
    }

    double number = 0.0;
    const char* first = line.data();
    const char* last = line.data() + line.size();
    auto [ptr, ec] = std::from_chars(first, last, number);
    if (ec == std::errc{} && ptr == last) {
        return Value(number);
    }

    return Value(line);
}

struct Options {
    bool numbers = false;
    bool sized = false;
    const char* input_path = nullptr;
    const char* output_path = nullptr;
};

static int do_encode(const Options& options) {
    std::ifstream file;
    std::istream* input = &std::cin;
    if (options.input_path != nullptr) {
        file.open(options.input_path);
        if (!file) {
            std::fprintf(stderr, "Error: Cannot read input file: %s\n", options.input_path);
            return 1;
        }
        input = &file;
    }

    std::string output_path;
    if (options.output_path != nullptr) {
        output_path = options.output_path;
    } else if (options.input_path != nullptr) {
        output_path = std::string(options.input_path) + ".ubj";
    }

    std::FILE* out = stdout;
    if (!output_path.empty()) {
        out = std::fopen(output_path.c_str(), "wb");
        if (out == nullptr) {
            std::fprintf(stderr, "Error: Cannot write output file: %s\n", output_path.c_str());
            return 1;
        }
    }

    std::size_t num_lines = 0;
    Value document;
    if (options.sized) {
        Array lines;
        std::string line;
        while (std::getline(*input, line)) {
            lines.push_back(line_to_value(line, options.numbers));
        }
        num_lines = lines.size();
        document = Value(std::move(lines));
    } else {
        bool numbers = options.numbers;
        document = Value(UnsizedArray::generate([input, numbers, &num_lines]() -> std::optional<Value> {
            std::string line;
            if (!std::getline(*input, line)) {
                return std::nullopt;
            }
            ++num_lines;
            return line_to_value(line, numbers);
        }));
    }

    std::size_t output_size = 0;
    FileSink file_sink(out);
    CallbackSink counting_sink([&file_sink, &output_size](const std::uint8_t* data,
                                                          std::size_t size) {
        output_size += size;
        return file_sink.write(data, size);
    });

    std::string detail;
    Error result = default_encoder().encode(document, counting_sink, &detail);

    if (out != stdout && std::fclose(out) != 0 && result == Error::Ok) {
        result = Error::SinkWrite;
        detail = "cannot close output file";
    }

    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: Encoding failed: %s\n",
                     detail.empty() ? error_string(result) : detail.c_str());
        return 1;
    }

    std::fprintf(stderr, "Input:       %s (%zu lines)\n",
                 options.input_path != nullptr ? options.input_path : "<stdin>", num_lines);
    std::fprintf(stderr, "Output:      %s (%zu bytes)\n",
                 output_path.empty() ? "<stdout>" : output_path.c_str(), output_size);
    std::fprintf(stderr, "Array:       %s\n", options.sized ? "sized" : "unsized");

    return 0;
}

int main(int argc, char** argv) {
    Options options;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            print_help(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--version") == 0) {
            print_version();
            return 0;
        }
        if (std::strcmp(arg, "-n") == 0) {
            options.numbers = true;
        } else if (std::strcmp(arg, "-s") == 0) {
            options.sized = true;
        } else if (std::strcmp(arg, "-o") == 0) {
            if (i + 1 >= argc) {
                std::fprintf(stderr, "Error: -o requires an output path\n");
                return 1;
            }
            options.output_path = argv[++i];
        } else if (arg[0] == '-' && arg[1] != '\0') {
            std::fprintf(stderr, "Error: Unknown option: %s\n", arg);
            std::fprintf(stderr, "Usage: %s [-n] [-s] [-o <output>] [<input>]\n", argv[0]);
            return 1;
        } else if (options.input_path == nullptr) {
            options.input_path = arg;
        } else {
            std::fprintf(stderr, "Error: Only one input file is accepted\n");
            return 1;
        }
    }

    return do_encode(options);
}
