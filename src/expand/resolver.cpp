#include "envfile/expand/resolver.hpp"
#include "envfile/core/logger.hpp"
#include "envfile/expand/interpolator.hpp"

namespace envfile::expand {

auto resolve(const std::vector<syntax::Binding>& bindings, const Environment& env,
             const ResolveOptions& options) -> Result<ValueMap> {
    ValueMap context;

    for (const auto& binding : bindings) {
        if (!options.interpolate || !binding.value) {
            context.set(binding.key, binding.value);
            continue;
        }

        Scope scope(context, env, options.override_existing);
        // Bindings built in code rather than parsed may carry no segments.
        auto expanded = binding.segments.empty()
            ? expand(*binding.value, scope)
            : expand_segments(binding.segments, scope, options.single_quotes_expand);
        if (!expanded) {
            LOG_DEBUG("Resolution stopped at line {}: {}",
                      binding.original.line, expanded.error().what());
            return std::unexpected(expanded.error());
        }

        context.set(binding.key, std::move(*expanded));
    }

    return context;
}

} // namespace envfile::expand
