/// @file merge_whitespace.cpp
/// @brief Runtime entry points over std::string
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#include "merge_whitespace.h"
#include "scanner.h"

#include <cstddef>
#include <cstring>
#include <string>
#include <string_view>

namespace merge_whitespace_cpp {

namespace {

/**
 * @brief Sink that appends to a std::string
 */
struct StringSink {
    std::string& out;

    void append(std::string_view bytes) { out.append(bytes.data(), bytes.size()); }
};

/**
 * @brief Sink that writes back over the buffer being scanned
 *
 * Every byte the scanner emits comes from a position at or after the
 * current write offset, so the write offset never passes the read offset.
 * memmove handles the overlap when a slice is copied onto itself.
 */
struct OverwriteSink {
    char* buffer;
    std::size_t written = 0;
    bool changed = false;

    void append(std::string_view bytes) {
        char* dest = buffer + written;
        if (dest != bytes.data()) {
            if (!changed && std::memcmp(dest, bytes.data(), bytes.size()) != 0) {
                changed = true;
            }
            std::memmove(dest, bytes.data(), bytes.size());
        }
        written += bytes.size();
    }
};

/**
 * @brief Sink that compares the output against the input as it goes
 */
struct CompareSink {
    std::string_view expected;
    std::size_t position = 0;
    bool matches = true;

    void append(std::string_view bytes) {
        if (matches && expected.substr(position, bytes.size()) != bytes) {
            matches = false;
        }
        position += bytes.size();
    }
};

} // namespace

std::string mergeWhitespace(std::string_view input) {
    return mergeWhitespace(input, MergeWhitespaceOptions{});
}

std::string mergeWhitespaceWithQuotes(std::string_view input,
                                      std::optional<char32_t> quoteChar,
                                      std::optional<char32_t> escapeChar) {
    MergeWhitespaceOptions options;
    options.quoteChar = quoteChar;
    options.escapeChar = escapeChar;
    return mergeWhitespace(input, options);
}

std::string mergeWhitespace(std::string_view input, MergeWhitespaceOptions const& options) {
    std::string result;
    result.reserve(input.size());
    StringSink sink{result};
    scan(input, options.scanOptions(), sink);
    return result;
}

bool mergeWhitespaceInPlace(std::string& text, MergeWhitespaceOptions const& options) {
    OverwriteSink sink{text.data()};
    scan(std::string_view(text), options.scanOptions(), sink);
    bool changed = sink.changed || sink.written != text.size();
    text.resize(sink.written);
    return changed;
}

bool isMerged(std::string_view input, MergeWhitespaceOptions const& options) {
    CompareSink sink{input};
    scan(input, options.scanOptions(), sink);
    return sink.matches && sink.position == input.size();
}

} // namespace merge_whitespace_cpp
