#include "envfile/core/utils.hpp"

#include <algorithm>
#include <cctype>

namespace envfile::utils {

auto trim(std::string_view s) -> std::string {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(start, end - start + 1));
}

auto to_lower(std::string_view s) -> std::string {
    std::string result(s);
    std::ranges::transform(result, result.begin(), ::tolower);
    return result;
}

auto is_alnum(std::string_view s) -> bool {
    if (s.empty()) return false;
    return std::ranges::all_of(s, [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0;
    });
}

auto shell_quote(std::string_view s) -> std::string {
    if (s.empty()) return "''";

    bool safe = std::ranges::all_of(s, [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0 ||
               std::string_view("@%+=:,./-_").find(c) != std::string_view::npos;
    });
    if (safe) return std::string(s);

    std::string result = "'";
    for (char c : s) {
        if (c == '\'') {
            result += "'\"'\"'";
        } else {
            result += c;
        }
    }
    result += '\'';
    return result;
}

auto parse_bool(std::string_view s, bool fallback) -> bool {
    auto v = to_lower(trim(s));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    return fallback;
}

} // namespace envfile::utils
