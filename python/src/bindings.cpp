#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "merge_whitespace.h"
#include "utf8_helpers.h"

#include <optional>
#include <string>

namespace py = pybind11;

namespace {

using merge_whitespace_cpp::MergeWhitespaceOptions;

// Python hands over one-character str values as UTF-8.
std::optional<char32_t> to_char(std::optional<std::string> const& value, char const* name) {
    if (!value) {
        return std::nullopt;
    }
    char32_t c = merge_whitespace_cpp::utf8::decodeSingle(*value);
    if (c == merge_whitespace_cpp::utf8::kInvalidCodepoint) {
        throw py::value_error(std::string(name) + " must be a single character");
    }
    return c;
}

} // namespace

PYBIND11_MODULE(merge_whitespace, m) {
    m.doc() = "merge_whitespace.cpp Python bindings";

    m.def(
        "merge_whitespace",
        [](std::string const& text) {
            py::gil_scoped_release release;
            return merge_whitespace_cpp::mergeWhitespace(text);
        },
        py::arg("text"),
        R"doc(
Replace each run of whitespace with one space and strip both ends.
)doc");

    m.def(
        "merge_whitespace_with_quotes",
        [](std::string const& text, std::optional<std::string> const& quote_char,
           std::optional<std::string> const& escape_char) {
            MergeWhitespaceOptions options;
            options.quoteChar = to_char(quote_char, "quote_char");
            options.escapeChar = to_char(escape_char, "escape_char");
            py::gil_scoped_release release;
            return merge_whitespace_cpp::mergeWhitespace(text, options);
        },
        py::arg("text"),
        py::arg("quote_char") = py::none(),
        py::arg("escape_char") = py::none(),
        R"doc(
Like merge_whitespace, but text between two quote_char characters is kept
as-is and the character after escape_char is never interpreted.
)doc");
}
