/// @file utf8_helpers.h
/// @brief Constant-evaluable UTF-8 decoding used by the scanner
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#ifndef MERGE_WHITESPACE_CPP_UTF8_HELPERS_H
#define MERGE_WHITESPACE_CPP_UTF8_HELPERS_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace merge_whitespace_cpp::utf8 {

// UTF-8 decoding masks and boundaries:
// - kAsciiMask identifies ASCII bytes (leading bit clear).
// - kLeadPayloadMask picks out payload bits from a lead byte once the length is known.
// - kMask2/3/4 and kLead2/3/4 identify 2/3/4-byte lead-byte patterns.
// - kContinuationMask/Sig/Payload validate continuation bytes and extract their payload bits.
// - kMinValues detects overlong encodings; surrogate/Unicode bounds reject invalid ranges.
constexpr unsigned char kAsciiMask        = 0x80; // 1000 0000
constexpr unsigned char kLeadPayloadMask  = 0x7F; // 0111 1111
constexpr unsigned char kMask2            = 0xE0; // 1110 0000
constexpr unsigned char kMask3            = 0xF0; // 1111 0000
constexpr unsigned char kMask4            = 0xF8; // 1111 1000
constexpr unsigned char kLead2            = 0xC0; // 1100 0000
constexpr unsigned char kLead3            = 0xE0; // 1110 0000
constexpr unsigned char kLead4            = 0xF0; // 1111 0000
constexpr unsigned char kContinuationMask = 0xC0; // 1100 0000
constexpr unsigned char kContinuationSig  = 0x80; // 1000 0000
constexpr unsigned char kContinuationPayload = 0x3F; // 0011 1111
constexpr std::array<std::uint32_t, 5> kMinValues = {0, 0, 0x80, 0x800, 0x10000}; // min code point per length
constexpr std::uint32_t kSurrogateStart   = 0xD800;
constexpr std::uint32_t kSurrogateEnd     = 0xDFFF;
constexpr std::uint32_t kUnicodeMax       = 0x10FFFF;

// Reported for bytes that do not start a well-formed sequence. Lies outside
// the Unicode range, so it never compares equal to a configured character.
constexpr char32_t kInvalidCodepoint = 0xFFFFFFFF;

// True when the byte is plain ASCII (no multi-byte prefix).
constexpr bool isAsciiLead(unsigned char lead) {
    return (lead & kAsciiMask) == 0;
}

// Infers expected UTF-8 sequence length from the lead-byte pattern.
constexpr std::size_t expectedLength(unsigned char lead) {
    if ((lead & kMask2) == kLead2) return 2;
    if ((lead & kMask3) == kLead3) return 3;
    if ((lead & kMask4) == kLead4) return 4;
    return 1;
}

// Checks whether a byte has the 10xxxxxx continuation signature.
constexpr bool isContinuation(unsigned char byte) {
    return (byte & kContinuationMask) == kContinuationSig;
}

// Validates decoded code points against overlong, surrogate, and range rules.
constexpr bool isInvalidCodepoint(std::uint32_t cp, std::size_t expected_len) {
    bool overlong = cp < kMinValues[expected_len];
    bool surrogate = cp >= kSurrogateStart && cp <= kSurrogateEnd;
    bool too_large = cp > kUnicodeMax;
    return overlong || surrogate || too_large;
}

// A decoded character and the byte span it occupies in the source text.
struct CodepointSlice {
    char32_t codepoint;
    std::size_t start;
    std::size_t length;
};

/// @brief Decode the character starting at byte offset @p i
///
/// Malformed, truncated or overlong sequences decode as a single byte
/// carrying kInvalidCodepoint, so scanning always makes progress.
///
/// @pre i < text.size()
constexpr CodepointSlice decodeAt(std::string_view text, std::size_t i) {
    unsigned char lead = static_cast<unsigned char>(text[i]);

    if (isAsciiLead(lead)) {
        return CodepointSlice{lead, i, 1};
    }

    std::size_t expected_len = expectedLength(lead);
    if (expected_len == 1 || i + expected_len > text.size()) {
        return CodepointSlice{kInvalidCodepoint, i, 1};
    }

    std::uint32_t codepoint = lead & (kLeadPayloadMask >> expected_len); // strip leading prefix bits
    for (std::size_t j = 1; j < expected_len; ++j) {
        unsigned char cont = static_cast<unsigned char>(text[i + j]);
        if (!isContinuation(cont)) {
            return CodepointSlice{kInvalidCodepoint, i, 1};
        }
        codepoint = (codepoint << 6) | (cont & kContinuationPayload);
    }

    if (isInvalidCodepoint(codepoint, expected_len)) {
        return CodepointSlice{kInvalidCodepoint, i, 1};
    }

    return CodepointSlice{static_cast<char32_t>(codepoint), i, expected_len};
}

/// @brief Decode @p text if it holds exactly one well-formed character
/// @return The code point, or kInvalidCodepoint for anything else
constexpr char32_t decodeSingle(std::string_view text) {
    if (text.empty()) {
        return kInvalidCodepoint;
    }
    CodepointSlice slice = decodeAt(text, 0);
    if (slice.length != text.size()) {
        return kInvalidCodepoint;
    }
    return slice.codepoint;
}

} // namespace merge_whitespace_cpp::utf8

#endif // MERGE_WHITESPACE_CPP_UTF8_HELPERS_H
