/// @file literal.h
/// @brief Merge whitespace in string literals at compile time
///
/// Long queries are easiest to read when laid out over many lines in the
/// source, but are usually sent as one line. merged_whitespace runs the
/// scanner during constant evaluation and names the result as a
/// std::string_view over static storage, so nothing happens at runtime.
///
/// @code{.cpp}
/// using namespace merge_whitespace_cpp;
///
/// constexpr std::string_view kQuery = merged_whitespace<R"(
///     query {
///       users (limit: 1, name: "Froozle   Frobnik") {
///         id
///       }
///     }
/// )", LiteralOptions{}.quote(U'"')>;
///
/// static_assert(kQuery == R"(query { users (limit: 1, name: "Froozle   Frobnik") { id } })");
/// @endcode
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#ifndef MERGE_WHITESPACE_CPP_LITERAL_H
#define MERGE_WHITESPACE_CPP_LITERAL_H

#include "scanner.h"

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace merge_whitespace_cpp {

/// @brief String literal usable as a template argument
///
/// @tparam N Size of the literal including its terminating null
template<std::size_t N>
struct FixedString {
    char chars[N]{};

    constexpr FixedString(char const (&text)[N]) {
        for (std::size_t i = 0; i < N; ++i) {
            chars[i] = text[i];
        }
    }

    constexpr std::string_view view() const { return std::string_view(chars, N - 1); }
};

/// @brief Quote and escape configuration usable as a template argument
///
/// std::optional is not a structural type, so presence is tracked with
/// separate flags. Build it with the named setters:
///
/// @code{.cpp}
/// LiteralOptions{}.quote(U'"').escape(U'\\')
/// @endcode
struct LiteralOptions {
    char32_t quoteChar = 0;
    bool hasQuoteChar = false;
    char32_t escapeChar = 0;
    bool hasEscapeChar = false;

    /// @brief Copy of these options with @p c as the quote character
    constexpr LiteralOptions quote(char32_t c) const {
        LiteralOptions copy = *this;
        copy.quoteChar = c;
        copy.hasQuoteChar = true;
        return copy;
    }

    /// @brief Copy of these options with @p c as the escape character
    constexpr LiteralOptions escape(char32_t c) const {
        LiteralOptions copy = *this;
        copy.escapeChar = c;
        copy.hasEscapeChar = true;
        return copy;
    }

    constexpr ScanOptions scanOptions() const {
        return ScanOptions{
            hasQuoteChar ? std::optional<char32_t>(quoteChar) : std::nullopt,
            hasEscapeChar ? std::optional<char32_t>(escapeChar) : std::nullopt};
    }
};

namespace detail {

// Fills a fixed array; capacity is exact, computed by a counting pass.
template<std::size_t Capacity>
struct ArraySink {
    std::array<char, Capacity>& out;
    std::size_t written = 0;

    constexpr void append(std::string_view bytes) {
        for (char c : bytes) {
            out[written++] = c;
        }
    }
};

template<FixedString Text, LiteralOptions Options>
struct MergedLiteral {
    static constexpr std::size_t size = mergedSize(Text.view(), Options.scanOptions());

    // One extra byte keeps the storage null-terminated for C APIs.
    static constexpr std::array<char, size + 1> storage = [] {
        std::array<char, size + 1> out{};
        ArraySink<size + 1> sink{out};
        scan(Text.view(), Options.scanOptions(), sink);
        return out;
    }();
};

} // namespace detail

/// @brief The merged form of a string literal, computed at compile time
///
/// @tparam Text The literal to merge
/// @tparam Options Quote and escape configuration; none by default
///
/// The view is null-terminated: data()[size()] == '\0'.
template<FixedString Text, LiteralOptions Options = LiteralOptions{}>
inline constexpr std::string_view merged_whitespace{
    detail::MergedLiteral<Text, Options>::storage.data(),
    detail::MergedLiteral<Text, Options>::size};

} // namespace merge_whitespace_cpp

#endif // MERGE_WHITESPACE_CPP_LITERAL_H
