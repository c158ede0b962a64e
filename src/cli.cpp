/**
 * @file cli.cpp
 * @brief epibits command line interface.
 *
 * Diagnostic front end for the encoding algebra: derive, print and combine
 * episode encodings from the command line.
 */

#include <epibits/epibits.hpp>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

using namespace epibits;

static void print_version() {
    std::printf("epibits %s (C++)\n", version());
}

static void print_help(const char* prog_name) {
    std::printf("\nEpisode Bitwise Encoding (v%s C++)\n", version());
    std::printf("==================================\n\n");
    std::printf("Usage:\n");
    std::printf("  %s encode <code> <width>\n", prog_name);
    std::printf("  %s window <start> <end> <reference> [step_days] [bits]\n", prog_name);
    std::printf("  %s scale <code> <width> <group>\n", prog_name);
    std::printf("  %s expand <code> <width> <extra_bits>\n", prog_name);
    std::printf("  %s interact <code1> <code2> <width> <extra_bits>\n\n", prog_name);
    std::printf("Options:\n");
    std::printf("  -h, --help     Show this help message\n");
    std::printf("  -v, --version  Show version information\n\n");
    std::printf("Arguments:\n");
    std::printf("  code           Decimal value, or 0b followed by bits (MSB first)\n");
    std::printf("  width          Number of bit positions (1-%zu)\n", MAX_WIDTH);
    std::printf("  start, end     Episode window, YYYY-MM-DD (inclusive)\n");
    std::printf("  reference      Reference date, YYYY-MM-DD (bit width-1)\n");
    std::printf("  step_days      Step between bits in days (default -1)\n");
    std::printf("  bits           Number of bits to derive (default %zu)\n", DEFAULT_BIT_COUNT);
    std::printf("  group          Bits merged into one when scaling down\n");
    std::printf("  extra_bits     Lingering effect length in bits\n\n");
    std::printf("Examples:\n");
    std::printf("  %s encode 2147483648 32\n", prog_name);
    std::printf("  %s window 2016-05-01 2016-05-10 2016-05-31\n", prog_name);
    std::printf("  %s interact 0b11000000 0b00010000 8 2\n\n", prog_name);
}

// strtoull accepts a sign after leading blanks and wraps negatives
static bool parse_unsigned(const char* text, unsigned long long& out) {
    if (std::strchr(text, '-') != nullptr) {
        return false;
    }
    char* end = nullptr;
    out = std::strtoull(text, &end, 10);
    return end != text && *end == '\0';
}

static bool parse_size(const char* text, std::size_t& out) {
    unsigned long long value = 0;
    if (!parse_unsigned(text, value)) {
        return false;
    }
    out = static_cast<std::size_t>(value);
    return true;
}

static bool parse_long(const char* text, long& out) {
    char* end = nullptr;
    out = std::strtol(text, &end, 10);
    return end != text && *end == '\0';
}

static bool parse_code(const char* text, BitVector& out) {
    if (std::strncmp(text, "0b", 2) == 0) {
        out = BitVector::from_string(text + 2);
        return true;
    }
    unsigned long long value = 0;
    if (!parse_unsigned(text, value)) {
        return false;
    }
    out = BitVector::from_uint64(value, 64);
    return true;
}

static bool parse_date(const char* text, std::chrono::sys_days& out) {
    int y = 0;
    unsigned m = 0;
    unsigned d = 0;
    char tail = '\0';
    if (std::sscanf(text, "%d-%u-%u%c", &y, &m, &d, &tail) != 3) {
        return false;
    }
    std::chrono::year_month_day ymd{std::chrono::year{y}, std::chrono::month{m},
                                    std::chrono::day{d}};
    if (!ymd.ok()) {
        return false;
    }
    out = std::chrono::sys_days{ymd};
    return true;
}

static void print_encoding(const char* label, const Encoding& e) {
    std::printf("%-11s %s\n", label, e.bit_sequence().c_str());
    if (e.value().bit_length() <= 64) {
        std::printf("Value:      %llu\n", static_cast<unsigned long long>(e.coding_value()));
    }
    std::printf("Width:      %zu\n", e.width());
    std::printf("Magnitude:  %zu\n", e.magnitude());
    std::printf("Score:      %llu\n", static_cast<unsigned long long>(e.score_bitorder()));
}

static int do_encode(const char* code_text, const char* width_text) {
    BitVector code;
    std::size_t width = 0;
    if (!parse_code(code_text, code) || !parse_size(width_text, width)) {
        std::fprintf(stderr, "Error: Invalid code or width\n");
        return 1;
    }
    print_encoding("Encoding:", Encoding(code, width));
    return 0;
}

static int do_window(int argc, char** argv) {
    std::chrono::sys_days start;
    std::chrono::sys_days end;
    std::chrono::sys_days reference;
    if (!parse_date(argv[2], start) || !parse_date(argv[3], end) ||
        !parse_date(argv[4], reference)) {
        std::fprintf(stderr, "Error: Dates must be YYYY-MM-DD\n");
        return 1;
    }

    long step_days = -1;
    std::size_t bits = DEFAULT_BIT_COUNT;
    if (argc > 5 && !parse_long(argv[5], step_days)) {
        std::fprintf(stderr, "Error: Invalid step: %s\n", argv[5]);
        return 1;
    }
    if (argc > 6 && !parse_size(argv[6], bits)) {
        std::fprintf(stderr, "Error: Invalid bit count: %s\n", argv[6]);
        return 1;
    }

    Encoding e = Encoding::from_time_window(start, end, reference,
                                            std::chrono::days(step_days), bits);
    print_encoding("Window:", e);
    return 0;
}

static int do_scale(const char* code_text, const char* width_text, const char* group_text) {
    BitVector code;
    std::size_t width = 0;
    std::size_t group = 0;
    if (!parse_code(code_text, code) || !parse_size(width_text, width) ||
        !parse_size(group_text, group)) {
        std::fprintf(stderr, "Error: Invalid code, width or group\n");
        return 1;
    }

    Encoding e(code, width);
    print_encoding("Original:", e);
    e.scale_down(group);
    print_encoding("Scaled:", e);
    return 0;
}

static int do_expand(const char* code_text, const char* width_text, const char* extra_text) {
    BitVector code;
    std::size_t width = 0;
    std::size_t extra_bits = 0;
    if (!parse_code(code_text, code) || !parse_size(width_text, width) ||
        !parse_size(extra_text, extra_bits)) {
        std::fprintf(stderr, "Error: Invalid code, width or extra bits\n");
        return 1;
    }

    Encoding e(code, width);
    print_encoding("Original:", e);
    e.post_expand(extra_bits);
    print_encoding("Expanded:", e);
    return 0;
}

static int do_interact(char** argv) {
    BitVector code1;
    BitVector code2;
    std::size_t width = 0;
    std::size_t extra_bits = 0;
    if (!parse_code(argv[2], code1) || !parse_code(argv[3], code2) ||
        !parse_size(argv[4], width) || !parse_size(argv[5], extra_bits)) {
        std::fprintf(stderr, "Error: Invalid codes, width or extra bits\n");
        return 1;
    }

    Encoding a(code1, width);
    Encoding b(code2, width);
    print_encoding("First:", a);
    print_encoding("Second:", b);
    print_encoding("Interaction:", Encoding::interaction(a, b, extra_bits));
    return 0;
}

static int dispatch(int argc, char** argv) {
    const char* command = argv[1];

    if (std::strcmp(command, "encode") == 0 && argc == 4) {
        return do_encode(argv[2], argv[3]);
    }
    if (std::strcmp(command, "window") == 0 && argc >= 5 && argc <= 7) {
        return do_window(argc, argv);
    }
    if (std::strcmp(command, "scale") == 0 && argc == 5) {
        return do_scale(argv[2], argv[3], argv[4]);
    }
    if (std::strcmp(command, "expand") == 0 && argc == 5) {
        return do_expand(argv[2], argv[3], argv[4]);
    }
    if (std::strcmp(command, "interact") == 0 && argc == 6) {
        return do_interact(argv);
    }

    std::fprintf(stderr, "Error: Unknown command or wrong number of arguments: %s\n", command);
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

    try {
        return dispatch(argc, argv);
    } catch (const EpibitsException& e) {
        std::fprintf(stderr, "Error: %s (%s)\n", e.what(), error_string(e.code()));
        return 1;
    }
}
