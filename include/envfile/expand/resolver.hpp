#pragma once

#include <vector>

#include "envfile/core/environment.hpp"
#include "envfile/core/error.hpp"
#include "envfile/core/ordered_map.hpp"
#include "envfile/syntax/parser.hpp"

namespace envfile::expand {

struct ResolveOptions {
    bool override_existing = false;     // document values win over the environment
    bool interpolate = true;            // expand ${...} at all
    bool single_quotes_expand = false;  // expand inside '...' too
};

/// Resolve a parsed document into its final values.
///
/// Bindings are processed top to bottom. Each value is expanded against the
/// values registered by earlier lines plus `env`, then registered itself, so
/// a line only ever sees what was defined before it: `A=${A}` reads the
/// previous `A`, and redefining a name later does not touch values already
/// computed from it. A repeated key keeps its first position and its last
/// value.
///
/// @returns the resolved values, or the first MissingVariable error raised
///          by a `?` / `:?` operator.
auto resolve(const std::vector<syntax::Binding>& bindings, const Environment& env,
             const ResolveOptions& options = {}) -> Result<ValueMap>;

} // namespace envfile::expand
