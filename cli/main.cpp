#include "merge_whitespace.h"
#include "utf8_helpers.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

using namespace merge_whitespace_cpp;

static void usage(char const* prog) {
    std::cerr << "Usage: " << prog << " [--file <path>] [--quote-char <c>] [--escape-char <c>]\n"
              << "Reads text from stdin or --file and writes it to stdout with each run of\n"
              << "whitespace merged into one space.\n"
              << "Options:\n"
              << "  --file <path>         Read text from file instead of stdin\n"
              << "  --quote-char <c>      Keep text between two <c> characters as-is\n"
              << "  --escape-char <c>     Copy the character after <c> as-is\n"
              << "  --verbose             Log configuration and sizes to stderr\n"
              << "  --help                Show this help\n";
}

static std::string read_all(std::istream& in) {
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// Accepts exactly one UTF-8 encoded character.
static std::optional<char32_t> parse_char(std::string_view value) {
    char32_t c = utf8::decodeSingle(value);
    if (c == utf8::kInvalidCodepoint) {
        return std::nullopt;
    }
    return c;
}

static std::string describe(std::optional<char32_t> c) {
    if (!c) {
        return "none";
    }
    return fmt::format("U+{:04X}", static_cast<std::uint32_t>(*c));
}

int main(int argc, char** argv) {
    auto logger = spdlog::stderr_color_mt("merge_whitespace");
    logger->set_pattern("%n: %^%l%$: %v");
    logger->set_level(spdlog::level::warn);

    std::string filePath;
    MergeWhitespaceOptions opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help") {
            usage(argv[0]);
            return 0;
        } else if (arg == "--file" && i + 1 < argc) {
            filePath = argv[++i];
        } else if ((arg == "--quote-char" || arg == "--escape-char") && i + 1 < argc) {
            std::string_view value = argv[++i];
            auto c = parse_char(value);
            if (!c) {
                logger->error("{} expects a single character, got '{}'", arg, value);
                usage(argv[0]);
                return 1;
            }
            if (arg == "--quote-char") {
                opts.quoteChar = c;
            } else {
                opts.escapeChar = c;
            }
        } else if (arg == "--verbose") {
            logger->set_level(spdlog::level::debug);
        } else {
            usage(argv[0]);
            return 1;
        }
    }

    logger->debug("quote char: {}, escape char: {}", describe(opts.quoteChar), describe(opts.escapeChar));

    std::string text;
    if (!filePath.empty()) {
        std::ifstream f(filePath, std::ios::binary);
        if (!f) {
            logger->error("failed to open {}", filePath);
            return 1;
        }
        text = read_all(f);
    } else {
        text = read_all(std::cin);
    }

    std::size_t inputSize = text.size();
    bool changed = mergeWhitespaceInPlace(text, opts);
    logger->debug("read {} bytes, wrote {} bytes{}", inputSize, text.size(), changed ? "" : " (unchanged)");

    std::cout << text;
    return 0;
}
