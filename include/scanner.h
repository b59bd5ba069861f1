/// @file scanner.h
/// @brief The whitespace-merging state machine
///
/// A single left-to-right pass over the input decides, one character at a
/// time, whether to collapse, preserve, or escape. Every maximal run of
/// unquoted whitespace becomes one space, runs at either end of the text are
/// dropped, and text between a pair of quote characters is copied verbatim.
/// An escape character copies the character after it through untouched, so
/// an escaped quote never toggles quoting and escaped whitespace is never
/// collapsed.
///
/// The scanner is a constexpr template over an output sink, which lets the
/// runtime functions in merge_whitespace.h and the compile-time constants in
/// literal.h share one implementation.
///
/// @par Whitespace Classification
///
/// Only the six ASCII whitespace characters are collapsible: space, tab,
/// line feed, vertical tab, form feed and carriage return. Other Unicode
/// spaces such as U+00A0 are ordinary characters.
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#ifndef MERGE_WHITESPACE_CPP_SCANNER_H
#define MERGE_WHITESPACE_CPP_SCANNER_H

#include "utf8_helpers.h"

#include <concepts>
#include <cstddef>
#include <optional>
#include <string_view>

namespace merge_whitespace_cpp {

/// @struct ScanOptions
/// @brief Characters with a special role during scanning
///
/// Either character may be absent. When both are set to the same value the
/// escape role wins and that character never toggles quoting.
struct ScanOptions {
    /// @brief Delimiter of spans whose content is kept verbatim
    std::optional<char32_t> quoteChar;

    /// @brief Marker that makes the following character literal
    std::optional<char32_t> escapeChar;
};

/// @brief Concept for the destination of scanner output
///
/// A sink receives the output as a sequence of byte slices, in order. The
/// scanner never asks a sink to retract anything it has appended.
template<typename T>
concept OutputSink = requires(T& sink, std::string_view bytes) {
    { sink.append(bytes) };
};

/// @brief Check whether a code point is collapsible whitespace
/// @retval true for U+0009 to U+000D and U+0020
/// @retval false otherwise
constexpr bool isCollapsibleWhitespace(char32_t codepoint) {
    return codepoint == U' ' || (codepoint >= U'\t' && codepoint <= U'\r');
}

/// @brief Run the state machine over @p input, writing to @p sink
///
/// Never fails. An unterminated quoted span runs to the end of the input and
/// is copied as-is, trailing whitespace included. An escape character at the
/// very end of the input is emitted and the pending escape is dropped.
///
/// @param[in] input UTF-8 text; malformed bytes pass through as ordinary
///                  characters
/// @param[in] options Quote and escape characters
/// @param[in,out] sink Receives the merged text
template<OutputSink Sink>
constexpr void scan(std::string_view input, ScanOptions const& options, Sink& sink) {
    constexpr std::string_view kSpace = " ";

    bool quoting = false;
    bool pendingEscape = false;
    bool inWhitespaceRun = false;
    bool emitted = false;

    // A run of unquoted whitespace only becomes output once something
    // follows it, and never at the start of the output.
    auto flushRun = [&]() {
        if (inWhitespaceRun && emitted) {
            sink.append(kSpace);
        }
        inWhitespaceRun = false;
    };

    auto emit = [&](utf8::CodepointSlice const& ch) {
        sink.append(input.substr(ch.start, ch.length));
        emitted = true;
    };

    for (std::size_t i = 0; i < input.size();) {
        utf8::CodepointSlice ch = utf8::decodeAt(input, i);
        i += ch.length;

        if (pendingEscape) {
            emit(ch);
            pendingEscape = false;
            inWhitespaceRun = false;
        } else if (options.escapeChar && ch.codepoint == *options.escapeChar) {
            flushRun();
            emit(ch);
            pendingEscape = true;
        } else if (options.quoteChar && ch.codepoint == *options.quoteChar) {
            flushRun();
            emit(ch);
            quoting = !quoting;
        } else if (quoting) {
            emit(ch);
            inWhitespaceRun = false;
        } else if (isCollapsibleWhitespace(ch.codepoint)) {
            inWhitespaceRun = true;
        } else {
            flushRun();
            emit(ch);
        }
    }

    // Trailing whitespace is never flushed.
}

/// @brief Sink that only measures the output length
struct CountingSink {
    std::size_t count = 0;

    constexpr void append(std::string_view bytes) { count += bytes.size(); }
};

/// @brief Number of bytes scan() produces for @p input
constexpr std::size_t mergedSize(std::string_view input, ScanOptions const& options) {
    CountingSink sink;
    scan(input, options, sink);
    return sink.count;
}

} // namespace merge_whitespace_cpp

#endif // MERGE_WHITESPACE_CPP_SCANNER_H
