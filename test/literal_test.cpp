// merge_whitespace.cpp/test/literal_test.cpp
#include <gtest/gtest.h>

#include "literal.h"
#include "merge_whitespace.h"

#include <string>
#include <string_view>

using namespace merge_whitespace_cpp;

namespace {

constexpr LiteralOptions kQuoted = LiteralOptions{}.quote(U'"');
constexpr LiteralOptions kQuotedEscaped = LiteralOptions{}.quote(U'"').escape(U'\\');

constexpr std::string_view kExample = merged_whitespace<"This   is   an  example   string.">;
static_assert(kExample == "This is an example string.");

static_assert(merged_whitespace<""> == "");
static_assert(merged_whitespace<" \t\r\n "> == "");
static_assert(merged_whitespace<"a  \"b   c\"  d", kQuoted> == "a \"b   c\" d");
static_assert(merged_whitespace<"a \\\" b", kQuotedEscaped> == "a \\\" b");
static_assert(merged_whitespace<"\"   \"", kQuoted> == "\"   \"");
static_assert(merged_whitespace<"x  \\  y", LiteralOptions{}.escape(U'\\')> == "x \\  y");

constexpr std::string_view kQuery = merged_whitespace<R"(
    query {
      users (limit: 1, name: "Froozle   Frobnik") {
        id
        name
      }
    }
)", kQuoted>;
static_assert(kQuery == R"(query { users (limit: 1, name: "Froozle   Frobnik") { id name } })");

} // namespace

TEST(LiteralTest, MatchesRuntimeResult) {
    constexpr char const* kInput = "Hello     World!\r\n      \"How        are\"         you?";
    constexpr std::string_view merged = merged_whitespace<"Hello     World!\r\n      \"How        are\"         you?">;
    EXPECT_EQ(merged, mergeWhitespace(kInput));
    EXPECT_EQ(merged, "Hello World! \"How are\" you?");

    constexpr std::string_view quoted = merged_whitespace<"Hello     World!\r\n      \"How        are\"         you?", kQuoted>;
    EXPECT_EQ(quoted, mergeWhitespaceWithQuotes(kInput, U'"', std::nullopt));
    EXPECT_EQ(quoted, "Hello World! \"How        are\" you?");
}

TEST(LiteralTest, StorageIsNullTerminated) {
    constexpr std::string_view merged = merged_whitespace<"  a   b  ">;
    EXPECT_EQ(merged.size(), 3u);
    EXPECT_EQ(merged.data()[merged.size()], '\0');
    EXPECT_EQ(std::string(merged.data()), "a b");
}

TEST(LiteralTest, SameTextAndOptionsShareStorage) {
    constexpr std::string_view first = merged_whitespace<"x   y", kQuoted>;
    constexpr std::string_view second = merged_whitespace<"x   y", LiteralOptions{}.quote(U'"')>;
    EXPECT_EQ(first.data(), second.data());
}

TEST(LiteralTest, OptionsBuilders) {
    constexpr LiteralOptions none{};
    static_assert(!none.scanOptions().quoteChar);
    static_assert(!none.scanOptions().escapeChar);

    constexpr ScanOptions both = kQuotedEscaped.scanOptions();
    static_assert(both.quoteChar && *both.quoteChar == U'"');
    static_assert(both.escapeChar && *both.escapeChar == U'\\');

    constexpr ScanOptions escapeOnly = LiteralOptions{}.escape(U'\\').scanOptions();
    static_assert(!escapeOnly.quoteChar);
    EXPECT_TRUE(escapeOnly.escapeChar.has_value());
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
