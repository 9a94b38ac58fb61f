#pragma once

#include <string>
#include <string_view>

#include "envfile/core/types.hpp"

namespace envfile::syntax {

/// Render one `KEY=value` line, newline included.
///
/// With QuoteMode::Always the value is wrapped in single quotes, `'` is
/// written as `\'` and a backslash is doubled only where the parser would
/// otherwise read it as an escape, so that parsing the line gives back
/// exactly `key` and `value`.
auto render(std::string_view key, std::string_view value,
            QuoteMode mode = QuoteMode::Always, bool export_key = false)
    -> std::string;

/// Single-quote `value` the way `render` does.
auto quote_value(std::string_view value) -> std::string;

} // namespace envfile::syntax
