/// @file merge_whitespace.h
/// @brief Merge runs of whitespace in text, keeping quoted spans intact
///
/// Turns human-formatted, multi-line text such as an embedded GraphQL or SQL
/// query into a single line. Every run of whitespace becomes one space,
/// whitespace at either end is removed, and text inside quotes is left as
/// written.
///
/// @code{.cpp}
/// std::string query = mergeWhitespaceWithQuotes(R"(
///     query {
///       users (filter: "bought a 12\" vinyl") {
///         id
///       }
///     }
/// )", U'"', U'\\');
/// // Result: query { users (filter: "bought a 12\" vinyl") { id } }
/// @endcode
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#ifndef MERGE_WHITESPACE_CPP_MERGE_WHITESPACE_H
#define MERGE_WHITESPACE_CPP_MERGE_WHITESPACE_H

#include "scanner.h"

#include <optional>
#include <string>
#include <string_view>

namespace merge_whitespace_cpp {

/// @struct MergeWhitespaceOptions
/// @brief Configuration for the runtime merge functions
///
/// @code{.cpp}
/// MergeWhitespaceOptions options;
/// options.quoteChar = U'"';
/// options.escapeChar = U'\\';
/// std::string out = mergeWhitespace(text, options);
/// @endcode
struct MergeWhitespaceOptions {
    /// @brief Quote character; whitespace between a pair of them is kept
    ///
    /// When unset, quoting is disabled and all whitespace is merged.
    std::optional<char32_t> quoteChar;

    /// @brief Escape character; the character after it is copied as-is
    ///
    /// When unset, every quote character toggles quoting.
    std::optional<char32_t> escapeChar;

    /// @brief The scanner configuration these options describe
    ScanOptions scanOptions() const { return ScanOptions{quoteChar, escapeChar}; }
};

/// @brief Merge whitespace with no quote handling
///
/// @param[in] input The text to merge
/// @return The text with every whitespace run replaced by one space and no
///         leading or trailing whitespace
///
/// @code{.cpp}
/// mergeWhitespace("Hello     World!\r\n      How  are  you?");
/// // Result: "Hello World! How are you?"
/// @endcode
std::string mergeWhitespace(std::string_view input);

/// @brief Merge whitespace, keeping quoted text as-is
///
/// @param[in] input The text to merge
/// @param[in] quoteChar Quote delimiter, or std::nullopt to disable quoting
/// @param[in] escapeChar Escape marker, or std::nullopt to disable escaping
/// @return The merged text
std::string mergeWhitespaceWithQuotes(std::string_view input,
                                      std::optional<char32_t> quoteChar,
                                      std::optional<char32_t> escapeChar);

/// @brief Merge whitespace using an options struct
/// @param[in] input The text to merge
/// @param[in] options Quote and escape configuration
/// @return The merged text
std::string mergeWhitespace(std::string_view input, MergeWhitespaceOptions const& options);

/// @brief Merge whitespace in place
///
/// The merged text is never longer than the input, so it is written over
/// the input buffer and the string is shrunk to fit.
///
/// @param[in,out] text The text to merge
/// @param[in] options Quote and escape configuration
/// @retval true if @p text was modified
/// @retval false if @p text was already merged
bool mergeWhitespaceInPlace(std::string& text, MergeWhitespaceOptions const& options = {});

/// @brief Check whether merging would leave @p input unchanged
/// @param[in] input The text to check
/// @param[in] options Quote and escape configuration
/// @retval true if @p input is already merged
/// @retval false otherwise
bool isMerged(std::string_view input, MergeWhitespaceOptions const& options = {});

} // namespace merge_whitespace_cpp

#endif // MERGE_WHITESPACE_CPP_MERGE_WHITESPACE_H
