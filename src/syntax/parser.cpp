#include "envfile/syntax/parser.hpp"
#include "envfile/core/logger.hpp"

#include <algorithm>
#include <istream>
#include <iterator>

namespace envfile::syntax {

namespace {

constexpr auto is_blank(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\f' || c == '\v';
}

constexpr auto is_newline(char c) -> bool {
    return c == '\n' || c == '\r';
}

constexpr auto is_space(char c) -> bool {
    return is_blank(c) || is_newline(c);
}

/// Number of line breaks in `s`; `\r\n` counts once.
auto count_lines(std::string_view s) -> int {
    int lines = 0;
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\n') {
            ++lines;
        } else if (s[i] == '\r') {
            ++lines;
            if (i + 1 < s.size() && s[i + 1] == '\n') ++i;
        }
    }
    return lines;
}

/// Forward-only cursor over the document.
class Reader {
public:
    explicit Reader(std::string_view text) : text_(text) {}

    [[nodiscard]] auto at_end() const -> bool { return pos_ >= text_.size(); }
    [[nodiscard]] auto at_line_end() const -> bool { return at_end() || is_newline(text_[pos_]); }
    [[nodiscard]] auto peek() const -> char { return at_end() ? '\0' : text_[pos_]; }
    [[nodiscard]] auto prev() const -> char { return pos_ == 0 ? '\0' : text_[pos_ - 1]; }
    [[nodiscard]] auto pos() const -> std::size_t { return pos_; }
    [[nodiscard]] auto rest() const -> std::string_view { return text_.substr(pos_); }
    [[nodiscard]] auto slice(std::size_t from) const -> std::string_view {
        return text_.substr(from, pos_ - from);
    }

    void advance(std::size_t n = 1) { pos_ = std::min(pos_ + n, text_.size()); }

    void skip_blanks() {
        while (!at_end() && is_blank(text_[pos_])) ++pos_;
    }

    void skip_to_line_end() {
        while (!at_line_end()) ++pos_;
    }

    void skip_newline() {
        if (peek() == '\r') {
            ++pos_;
            if (peek() == '\n') ++pos_;
        } else if (peek() == '\n') {
            ++pos_;
        }
    }

private:
    std::string_view text_;
    std::size_t pos_ = 0;
};

auto decode_double_quote_escape(char c) -> std::optional<char> {
    switch (c) {
        case '\\': return '\\';
        case '\'': return '\'';
        case '"':  return '"';
        case 'a':  return '\a';
        case 'b':  return '\b';
        case 'f':  return '\f';
        case 'n':  return '\n';
        case 'r':  return '\r';
        case 't':  return '\t';
        case 'v':  return '\v';
        default:   return std::nullopt;
    }
}

/// Read a '...' run starting at the opening quote. Returns nullopt (and
/// leaves the reader untouched) when the quote is never closed, or when it
/// reaches a line break and `multiline` is false.
auto read_single_quoted(Reader& reader, bool multiline) -> std::optional<std::string> {
    auto body = reader.rest();
    std::string out;

    for (std::size_t i = 1; i < body.size(); ++i) {
        char c = body[i];
        if (!multiline && is_newline(c)) return std::nullopt;
        if (c == '\\' && i + 1 < body.size() &&
            (body[i + 1] == '\\' || body[i + 1] == '\'')) {
            out += body[++i];
            continue;
        }
        if (c == '\'') {
            reader.advance(i + 1);
            return out;
        }
        out += c;
    }
    return std::nullopt;
}

/// Read a "..." run starting at the opening quote. Unknown escapes such as
/// `\$` are kept verbatim so the interpolator sees them unchanged.
auto read_double_quoted(Reader& reader, bool multiline) -> std::optional<std::string> {
    auto body = reader.rest();
    std::string out;

    for (std::size_t i = 1; i < body.size(); ++i) {
        char c = body[i];
        if (!multiline && is_newline(c)) return std::nullopt;
        if (c == '\\' && i + 1 < body.size()) {
            if (!multiline && is_newline(body[i + 1])) return std::nullopt;
            if (auto decoded = decode_double_quote_escape(body[i + 1])) {
                out += *decoded;
            } else {
                out += c;
                out += body[i + 1];
            }
            ++i;
            continue;
        }
        if (c == '"') {
            reader.advance(i + 1);
            return out;
        }
        out += c;
    }
    return std::nullopt;
}

auto read_key(Reader& reader) -> std::optional<std::string> {
    if (reader.peek() == '\'') {
        auto body = reader.rest();
        auto close = body.find_first_of("'\r\n", 1);
        if (close == std::string_view::npos || close == 1 || body[close] != '\'') {
            return std::nullopt;
        }
        reader.advance(close + 1);
        return std::string(body.substr(1, close - 1));
    }

    auto start = reader.pos();
    while (!reader.at_end()) {
        char c = reader.peek();
        if (c == '=' || c == '#' || is_space(c)) break;
        reader.advance();
    }
    if (reader.pos() == start) return std::nullopt;
    return std::string(reader.slice(start));
}

auto read_value(Reader& reader) -> std::optional<std::vector<Segment>> {
    std::vector<Segment> segments;
    auto value_start = reader.pos();

    while (!reader.at_line_end()) {
        char c = reader.peek();

        if (c == '\'' || c == '"') {
            // Only a quote that opens the value may run over several lines.
            bool multiline = reader.pos() == value_start;
            auto text = (c == '\'') ? read_single_quoted(reader, multiline)
                                    : read_double_quoted(reader, multiline);
            if (!text) return std::nullopt;
            segments.push_back({c == '\'' ? QuoteClass::SingleQuoted : QuoteClass::DoubleQuoted,
                                std::move(*text)});
            continue;
        }

        // Inline comment: '#' preceded by a blank inside the value.
        if (c == '#' && reader.pos() > value_start && is_blank(reader.prev())) {
            break;
        }

        if (segments.empty() || segments.back().quote != QuoteClass::Unquoted) {
            segments.push_back({QuoteClass::Unquoted, {}});
        }
        segments.back().text += c;
        reader.advance();
    }

    if (!segments.empty() && segments.back().quote == QuoteClass::Unquoted) {
        auto& text = segments.back().text;
        auto end = text.find_last_not_of(" \t\f\v");
        if (end == std::string::npos) {
            segments.pop_back();
        } else {
            text.erase(end + 1);
        }
    }

    return segments;
}

auto read_binding(Reader& reader) -> std::optional<Binding> {
    auto rest = reader.rest();
    if (rest.starts_with("export") && rest.size() > 6 && is_blank(rest[6])) {
        reader.advance(6);
        reader.skip_blanks();
    }

    auto key = read_key(reader);
    if (!key) return std::nullopt;

    Binding binding;
    binding.key = std::move(*key);

    reader.skip_blanks();
    if (reader.peek() == '=') {
        reader.advance();
        reader.skip_blanks();

        auto segments = read_value(reader);
        if (!segments) return std::nullopt;

        std::string value;
        for (const auto& segment : *segments) {
            value += segment.text;
        }
        binding.value = std::move(value);
        binding.segments = std::move(*segments);
    }

    reader.skip_blanks();
    if (reader.peek() == '#') {
        reader.skip_to_line_end();
    }
    if (!reader.at_line_end()) return std::nullopt;
    reader.skip_newline();

    return binding;
}

auto read_statement(Reader& reader, int line) -> Statement {
    auto start = reader.pos();
    Statement statement;
    statement.original.line = line;

    reader.skip_blanks();
    if (reader.at_line_end() || reader.peek() == '#') {
        reader.skip_to_line_end();
        reader.skip_newline();
        statement.original.text = std::string(reader.slice(start));
        return statement;
    }

    auto binding = read_binding(reader);
    if (!binding) {
        statement.error = true;
        reader.skip_to_line_end();
        reader.skip_newline();
    }

    statement.original.text = std::string(reader.slice(start));
    if (binding) {
        binding->original = statement.original;
        statement.binding = std::move(binding);
    }
    return statement;
}

} // anonymous namespace

auto parse_statements(std::string_view text) -> std::vector<Statement> {
    std::vector<Statement> statements;
    Reader reader(text);
    int line = 1;

    while (!reader.at_end()) {
        auto statement = read_statement(reader, line);
        line += count_lines(statement.original.text);
        statements.push_back(std::move(statement));
    }

    return statements;
}

auto parse(std::string_view text) -> std::vector<Binding> {
    std::vector<Binding> bindings;

    for (auto& statement : parse_statements(text)) {
        if (statement.error) {
            LOG_WARN("Could not parse statement starting at line {}", statement.original.line);
            continue;
        }
        if (statement.binding) {
            bindings.push_back(std::move(*statement.binding));
        }
    }

    LOG_DEBUG("Parsed {} bindings", bindings.size());
    return bindings;
}

auto parse(std::istream& in) -> std::vector<Binding> {
    std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    return parse(text);
}

} // namespace envfile::syntax
