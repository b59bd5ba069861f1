// merge_whitespace.cpp/fuzz/merge_whitespace_fuzzer.cpp
//
// libFuzzer harness. Byte 0 picks the quote character and byte 1 the escape
// character (each only if printable ASCII); the rest is the input text.

#include "merge_whitespace.h"
#include "scanner.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace {

using namespace merge_whitespace_cpp;

std::optional<char32_t> graphicOrNone(std::uint8_t byte) {
    if (byte > 0x20 && byte < 0x7F) {
        return static_cast<char32_t>(byte);
    }
    return std::nullopt;
}

void check(bool condition) {
    if (!condition) {
        __builtin_trap();
    }
}

} // namespace

extern "C" int LLVMFuzzerTestOneInput(std::uint8_t const* data, std::size_t size) {
    if (size < 2) {
        return 0;
    }

    MergeWhitespaceOptions options;
    options.quoteChar = graphicOrNone(data[0]);
    options.escapeChar = graphicOrNone(data[1]);
    std::string_view input(reinterpret_cast<char const*>(data + 2), size - 2);

    std::string quoted = mergeWhitespace(input, options);
    check(quoted.size() <= input.size());
    check(mergeWhitespace(quoted, options) == quoted);
    check(isMerged(quoted, options));

    std::string inPlace(input);
    mergeWhitespaceInPlace(inPlace, options);
    check(inPlace == quoted);

    std::string plain = mergeWhitespace(input);
    check(plain.size() <= input.size());
    check(plain.empty() || (!isCollapsibleWhitespace(plain.front()) && !isCollapsibleWhitespace(plain.back())));
    check(plain.find("  ") == std::string::npos);
    check(mergeWhitespace(plain) == plain);

    return 0;
}
