#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace envfile::syntax {

/// Quoting of one run of characters inside a value.
enum class QuoteClass {
    Unquoted,
    SingleQuoted,
    DoubleQuoted,
};

/// One run of a value with its escapes already decoded.
struct Segment {
    QuoteClass quote = QuoteClass::Unquoted;
    std::string text;

    friend auto operator==(const Segment&, const Segment&) -> bool = default;
};

/// Exact source text of a statement and the 1-based line it starts on.
struct Original {
    std::string text;
    int line = 0;
};

/// A `KEY=value` or bare `KEY` declaration.
///
/// `value` is the concatenation of `segments`; it is `nullopt` for a bare
/// name without `=`, and an empty string for `KEY=`.
struct Binding {
    std::string key;
    std::optional<std::string> value;
    std::vector<Segment> segments;
    Original original;
};

/// One span of the document: a binding, a blank line, a comment line, or
/// something that could not be parsed (`error`). The `original.text` of all
/// statements concatenated is exactly the parsed input.
struct Statement {
    Original original;
    std::optional<Binding> binding;
    bool error = false;
};

/// Split a document into statements. Never fails.
///
/// Grammar per statement:
///   - optional `export` keyword followed by blanks
///   - key: `'quoted'` or a run of characters other than `=`, `#`, blanks
///   - optional `=` and a value made of adjacent segments:
///       unquoted   up to a quote, end of line, or ` #` (inline comment)
///       '...'      `\'` and `\\` escapes only, may span lines
///       "..."      `\\ \' \" \a \b \f \n \r \t \v` escapes, may span lines
///   - optional `# comment`, then end of line
auto parse_statements(std::string_view text) -> std::vector<Statement>;

/// Bindings of a document in source order. Unparsable statements are
/// skipped with a warning naming their line.
auto parse(std::string_view text) -> std::vector<Binding>;

/// Consume `in` to the end and parse it.
auto parse(std::istream& in) -> std::vector<Binding>;

} // namespace envfile::syntax
