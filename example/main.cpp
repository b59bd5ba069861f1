// merge_whitespace.cpp/example/main.cpp
#include "literal.h"
#include "merge_whitespace.h"

#include <functional>
#include <iostream>
#include <string>
#include <string_view>

using namespace merge_whitespace_cpp;

// Merged while compiling; the binary only contains the single-line form.
constexpr std::string_view kUsersQuery = merged_whitespace<R"graphql(
    query {
      users (limit: 1, filter: "bought a 12\" vinyl
                                named \"spaces  in  space \"") {
        id
        name
        todos(order_by: {created_at: desc}, limit: 5) {
          id
          title
        }
      }
    }
)graphql", LiteralOptions{}.quote(U'"').escape(U'\\')>;

int main() {
    std::string text = R"text(
    SELECT  name,   email
      FROM  users
     WHERE  name = 'Ada   Lovelace'
       AND  note = 'it\'s   here'
)text";

    auto demo = [&](std::string const& title, std::function<void(MergeWhitespaceOptions&)> configure) {
        MergeWhitespaceOptions options;
        configure(options);
        std::cout << title << "\n" << mergeWhitespace(text, options) << "\n\n";
    };

    demo("**No quoting**", [](MergeWhitespaceOptions&) {});

    demo("**Quote: '**", [](MergeWhitespaceOptions& opts) {
        opts.quoteChar = U'\'';
    });

    demo("**Quote: ', Escape: \\**", [](MergeWhitespaceOptions& opts) {
        opts.quoteChar = U'\'';
        opts.escapeChar = U'\\';
    });

    std::cout << "**Compile-time literal**\n" << kUsersQuery << "\n\n";

    std::string buffer = "  already   in   a   buffer  ";
    bool changed = mergeWhitespaceInPlace(buffer);
    std::cout << "**In place (" << (changed ? "changed" : "unchanged") << ")**\n" << buffer << "\n";

    return 0;
}
