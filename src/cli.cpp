/**
 * @file cli.cpp
 * @brief bitgrid command line interface.
 *
 * Inspects and transforms bit matrices stored in the text grid format.
 */

#include <bitgrid/bitgrid.hpp>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace bitgrid;

static constexpr const char* CLI_SET_TOKEN = "X";
static constexpr const char* CLI_UNSET_TOKEN = ".";

static void print_version() {
    std::printf("bitgrid %s (C++)\n", version());
}

static void print_help(const char* prog_name) {
    std::printf("\nbitgrid %s - packed bit matrix tool\n", version());
    std::printf("=====================================\n\n");
    std::printf("Usage:\n");
    std::printf("  %s info <grid.txt> [options]\n", prog_name);
    std::printf("  %s rotate <grid.txt> [options]\n", prog_name);
    std::printf("  %s xor <grid.txt> <mask.txt> [options]\n", prog_name);
    std::printf("  %s region <grid.txt> <left> <top> <width> <height> [options]\n\n", prog_name);
    std::printf("Commands:\n");
    std::printf("  info           Print dimensions, set bit count and bounds\n");
    std::printf("  rotate         Print the grid rotated by 180 degrees\n");
    std::printf("  xor            Print the grid XOR the mask\n");
    std::printf("  region         Set a rectangle and print the grid\n\n");
    std::printf("Options:\n");
    std::printf("  --set <token>    Token for a set bit (default \"%s\")\n", CLI_SET_TOKEN);
    std::printf("  --unset <token>  Token for an unset bit (default \"%s\")\n", CLI_UNSET_TOKEN);
    std::printf("  -h, --help       Show this help message\n");
    std::printf("  -v, --version    Show version information\n\n");
    std::printf("Examples:\n");
    std::printf("  %s info code.txt\n", prog_name);
    std::printf("  %s xor code.txt mask.txt --set '#' --unset ' '\n\n", prog_name);
}

static bool read_file(const std::string& path, std::string& text) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    text = contents.str();
    return true;
}

static bool parse_size(const char* arg, std::size_t& value) {
    char* end = nullptr;
    unsigned long long parsed = std::strtoull(arg, &end, 10);
    if (end == arg || *end != '\0' || arg[0] == '-') {
        return false;
    }
    value = static_cast<std::size_t>(parsed);
    return true;
}

static int load_matrix(const std::string& path, const std::string& set_token,
                       const std::string& unset_token, BitMatrix& matrix) {
    std::string text;
    if (!read_file(path, text)) {
        std::fprintf(stderr, "Error: Cannot read input file: %s\n", path.c_str());
        return 1;
    }

    Error result = BitMatrix::parse(text, set_token, unset_token, matrix);
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: Cannot parse %s: %s\n", path.c_str(), error_string(result));
        return 1;
    }
    return 0;
}

static std::size_t count_set_bits(const BitMatrix& matrix) {
    std::size_t count = 0;
    for (std::size_t y = 0; y < matrix.height(); ++y) {
        const word_t* row = matrix.row_data(y);
        for (std::size_t i = 0; i < matrix.row_size(); ++i) {
            count += static_cast<std::size_t>(__builtin_popcount(row[i]));
        }
    }
    return count;
}

static int do_info(const BitMatrix& matrix) {
    std::printf("Size:         %zu x %zu (%zu words per row)\n", matrix.width(), matrix.height(),
                matrix.row_size());
    std::printf("Set bits:     %zu\n", count_set_bits(matrix));

    Rectangle rect;
    if (matrix.get_enclosing_rectangle(rect)) {
        std::printf("Bounds:       left=%zu top=%zu width=%zu height=%zu\n", rect.left, rect.top,
                    rect.width, rect.height);
    } else {
        std::printf("Bounds:       none\n");
    }

    Point point;
    if (matrix.get_top_left_on_bit(point)) {
        std::printf("Top-left:     (%zu, %zu)\n", point.x, point.y);
    } else {
        std::printf("Top-left:     none\n");
    }
    if (matrix.get_bottom_right_on_bit(point)) {
        std::printf("Bottom-right: (%zu, %zu)\n", point.x, point.y);
    } else {
        std::printf("Bottom-right: none\n");
    }

    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2 || std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        print_help(argv[0]);
        return (argc < 2) ? 1 : 0;
    }

    if (std::strcmp(argv[1], "-v") == 0 || std::strcmp(argv[1], "--version") == 0) {
        print_version();
        return 0;
    }

    std::string command = argv[1];
    std::string set_token = CLI_SET_TOKEN;
    std::string unset_token = CLI_UNSET_TOKEN;
    std::vector<const char*> args;

    for (int i = 2; i < argc; ++i) {
        bool is_set = std::strcmp(argv[i], "--set") == 0;
        bool is_unset = std::strcmp(argv[i], "--unset") == 0;
        if (is_set || is_unset) {
            if (i + 1 >= argc) {
                std::fprintf(stderr, "Error: %s requires a value\n", argv[i]);
                return 1;
            }
            if (is_set) {
                set_token = argv[i + 1];
            } else {
                unset_token = argv[i + 1];
            }
            ++i;
        } else {
            args.push_back(argv[i]);
        }
    }

    if (set_token.empty() || unset_token.empty() || set_token == unset_token) {
        std::fprintf(stderr, "Error: tokens must be non-empty and distinct\n");
        return 1;
    }

    std::size_t expected_args = 0;
    if (command == "info" || command == "rotate") {
        expected_args = 1;
    } else if (command == "xor") {
        expected_args = 2;
    } else if (command == "region") {
        expected_args = 5;
    } else {
        std::fprintf(stderr, "Error: Unknown command: %s\n", command.c_str());
        std::fprintf(stderr, "Run '%s --help' for usage\n", argv[0]);
        return 1;
    }

    if (args.size() != expected_args) {
        std::fprintf(stderr, "Error: %s requires %zu arguments\n", command.c_str(), expected_args);
        return 1;
    }

    BitMatrix matrix;
    if (load_matrix(args[0], set_token, unset_token, matrix) != 0) {
        return 1;
    }

    Error result = Error::Ok;
    if (command == "info") {
        return do_info(matrix);
    } else if (command == "rotate") {
        result = matrix.rotate180();
    } else if (command == "xor") {
        BitMatrix mask;
        if (load_matrix(args[1], set_token, unset_token, mask) != 0) {
            return 1;
        }
        result = matrix.xor_with(mask);
    } else {
        std::size_t region[4];
        for (std::size_t i = 0; i < 4; ++i) {
            if (!parse_size(args[i + 1], region[i])) {
                std::fprintf(stderr, "Error: Invalid region value: %s\n", args[i + 1]);
                return 1;
            }
        }
        result = matrix.set_region(region[0], region[1], region[2], region[3]);
    }

    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: %s failed: %s\n", command.c_str(), error_string(result));
        return 1;
    }

    std::fputs(matrix.to_string(set_token, unset_token).c_str(), stdout);
    return 0;
}
