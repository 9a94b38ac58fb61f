#include "envfile/syntax/serializer.hpp"
#include "envfile/core/utils.hpp"

namespace envfile::syntax {

auto quote_value(std::string_view value) -> std::string {
    std::string out;
    out.reserve(value.size() + 2);
    out += '\'';

    for (std::size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '\'') {
            out += "\\'";
        } else if (c == '\\') {
            // A lone backslash is literal inside '...', except right before
            // another backslash, a quote, or the closing quote.
            bool last = i + 1 == value.size();
            if (last || value[i + 1] == '\\' || value[i + 1] == '\'') {
                out += "\\\\";
            } else {
                out += c;
            }
        } else {
            out += c;
        }
    }

    out += '\'';
    return out;
}

auto render(std::string_view key, std::string_view value, QuoteMode mode, bool export_key)
    -> std::string {
    bool quote = mode == QuoteMode::Always ||
                 (mode == QuoteMode::Auto && !utils::is_alnum(value));

    std::string line;
    if (export_key) line += "export ";
    line += key;
    line += '=';
    line += quote ? quote_value(value) : std::string(value);
    line += '\n';
    return line;
}

} // namespace envfile::syntax
