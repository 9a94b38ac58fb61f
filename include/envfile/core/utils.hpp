#pragma once

#include <string>
#include <string_view>

namespace envfile::utils {

auto trim(std::string_view s) -> std::string;
auto to_lower(std::string_view s) -> std::string;

/// True when `s` is non-empty and every character is an ASCII letter or digit.
auto is_alnum(std::string_view s) -> bool;

/// Quote `s` for a POSIX shell: returned unchanged when it only holds safe
/// characters, otherwise wrapped in single quotes with `'` written as `'"'"'`.
auto shell_quote(std::string_view s) -> std::string;

/// Parse "1/0", "true/false", "yes/no", "on/off" (case-insensitive).
auto parse_bool(std::string_view s, bool fallback) -> bool;

} // namespace envfile::utils
