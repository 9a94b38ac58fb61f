#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "envfile/core/environment.hpp"
#include "envfile/core/error.hpp"
#include "envfile/core/ordered_map.hpp"
#include "envfile/syntax/parser.hpp"

namespace envfile::expand {

/// Name lookup for one expansion: values defined earlier in the document
/// (`context`) merged with the process environment.
///
/// With `override_existing` the document wins over the environment,
/// otherwise the environment wins. A bare name in the document (held as
/// `nullopt`) counts as set to the empty string.
class Scope {
public:
    Scope(const ValueMap& context, const Environment& env, bool override_existing)
        : context_(context), env_(env), override_existing_(override_existing) {}

    /// Value of `name`, or nullopt when it is unset in both sources.
    [[nodiscard]] auto lookup(const std::string& name) const -> std::optional<std::string>;

private:
    [[nodiscard]] auto from_context(const std::string& name) const -> std::optional<std::string>;
    [[nodiscard]] auto from_env(const std::string& name) const -> std::optional<std::string>;

    const ValueMap& context_;
    const Environment& env_;
    bool override_existing_;
};

/// Expand every `${...}` token in `text`, left to right.
///
/// Supported forms: `${NAME}`, `${NAME-word}`, `${NAME:-word}`,
/// `${NAME+word}`, `${NAME:+word}`, `${NAME?word}`, `${NAME:?word}`.
/// Words are expanded only when used, at any nesting depth. `$NAME`
/// without braces, an unmatched `${` and unknown operators are left as
/// they are.
///
/// @returns the expanded text, or ErrorCode::MissingVariable (message =
///          name, detail = word) when a `?` operator fires.
auto expand(std::string_view text, const Scope& scope) -> Result<std::string>;

/// Expand a parsed value. Single-quoted segments are copied literally
/// unless `single_quotes_expand` is set; other adjacent segments are
/// joined and expanded as one run.
auto expand_segments(const std::vector<syntax::Segment>& segments, const Scope& scope,
                     bool single_quotes_expand) -> Result<std::string>;

} // namespace envfile::expand
