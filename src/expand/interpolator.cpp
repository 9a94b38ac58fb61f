#include "envfile/expand/interpolator.hpp"
#include "envfile/core/logger.hpp"

#include <optional>
#include <string>
#include <vector>

namespace envfile::expand {

namespace {

constexpr std::string_view kNullOrUnset = "parameter null or not set";

/// For every `{` in `text`, the index of the `}` that closes it, counting
/// nested braces; npos when it is never closed. One pass, one stack.
auto match_braces(std::string_view text) -> std::vector<std::size_t> {
    std::vector<std::size_t> closing(text.size(), std::string_view::npos);
    std::vector<std::size_t> open;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '{') {
            open.push_back(i);
        } else if (text[i] == '}' && !open.empty()) {
            closing[open.back()] = i;
            open.pop_back();
        }
    }
    return closing;
}

/// A stretch of text being expanded: the top-level value or the word of a
/// token that is in use. A word under `?` carries the name it reports.
struct Frame {
    std::size_t pos;
    std::size_t end;
    std::string out;
    std::optional<std::string> required;
};

} // anonymous namespace

auto Scope::lookup(const std::string& name) const -> std::optional<std::string> {
    if (override_existing_) {
        if (auto v = from_context(name)) return v;
        return from_env(name);
    }
    if (auto v = from_env(name)) return v;
    return from_context(name);
}

auto Scope::from_context(const std::string& name) const -> std::optional<std::string> {
    const auto* entry = context_.find(name);
    if (!entry) return std::nullopt;
    return entry->value_or("");
}

auto Scope::from_env(const std::string& name) const -> std::optional<std::string> {
    auto it = env_.find(name);
    if (it == env_.end()) return std::nullopt;
    return it->second;
}

auto expand(std::string_view text, const Scope& scope) -> Result<std::string> {
    auto closing = match_braces(text);

    // Nested words are kept on an explicit stack, so nesting depth is
    // bounded by memory rather than by the call stack.
    std::vector<Frame> frames;
    frames.push_back(Frame{0, text.size(), {}, std::nullopt});
    frames.back().out.reserve(text.size());

    while (true) {
        auto& frame = frames.back();
        auto start = text.substr(0, frame.end).find("${", frame.pos);

        if (start == std::string_view::npos) {
            frame.out += text.substr(frame.pos, frame.end - frame.pos);
            Frame done = std::move(frame);
            frames.pop_back();

            if (done.required) {
                if (done.out.empty()) done.out = kNullOrUnset;
                LOG_DEBUG("Required variable {} is null or not set", *done.required);
                return std::unexpected(make_error(
                    ErrorCode::MissingVariable, *done.required, std::move(done.out)));
            }
            if (frames.empty()) return std::move(done.out);
            frames.back().out += done.out;
            continue;
        }

        frame.out += text.substr(frame.pos, start - frame.pos);

        auto close = closing[start + 1];
        if (close == std::string_view::npos || close >= frame.end) {
            frame.out += text.substr(start, frame.end - start);
            frame.pos = frame.end;
            continue;
        }
        frame.pos = close + 1;

        auto body = text.substr(start + 2, close - start - 2);
        auto name_end = body.find_first_of(":-+?");
        std::string name(body.substr(0, name_end));

        if (name_end == std::string_view::npos) {
            frame.out += scope.lookup(name).value_or("");
            continue;
        }

        bool colon = body[name_end] == ':';
        auto op_pos = name_end + (colon ? 1 : 0);
        char op = op_pos < body.size() ? body[op_pos] : '\0';
        if (op != '-' && op != '+' && op != '?') {
            frame.out += text.substr(start, close - start + 1);
            continue;
        }

        auto value = scope.lookup(name);
        // Plain operators test "set", the ':' variants test "set and not empty".
        bool present = colon ? (value.has_value() && !value->empty()) : value.has_value();

        bool use_word = (op == '+') ? present : !present;
        if (!use_word) {
            if (op != '+') frame.out += *value;
            continue;
        }

        Frame word{start + 2 + op_pos + 1, close, {}, std::nullopt};
        if (op == '?') word.required = std::move(name);
        frames.push_back(std::move(word));
    }
}

auto expand_segments(const std::vector<syntax::Segment>& segments, const Scope& scope,
                     bool single_quotes_expand) -> Result<std::string> {
    std::string result;
    std::string run;

    auto flush = [&]() -> VoidResult {
        if (run.empty()) return {};
        auto expanded = expand(run, scope);
        if (!expanded) return std::unexpected(expanded.error());
        result += *expanded;
        run.clear();
        return {};
    };

    for (const auto& segment : segments) {
        if (segment.quote == syntax::QuoteClass::SingleQuoted && !single_quotes_expand) {
            if (auto r = flush(); !r) return std::unexpected(r.error());
            result += segment.text;
        } else {
            run += segment.text;
        }
    }
    if (auto r = flush(); !r) return std::unexpected(r.error());

    return result;
}

} // namespace envfile::expand
