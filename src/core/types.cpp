#include "envfile/core/types.hpp"
#include "envfile/core/utils.hpp"

namespace envfile {

auto parse_quote_mode(std::string_view s) -> std::optional<QuoteMode> {
    auto v = utils::to_lower(utils::trim(s));
    if (v == "always") return QuoteMode::Always;
    if (v == "auto") return QuoteMode::Auto;
    if (v == "never") return QuoteMode::Never;
    return std::nullopt;
}

auto quote_mode_to_string(QuoteMode mode) -> std::string_view {
    switch (mode) {
        case QuoteMode::Always: return "always";
        case QuoteMode::Auto: return "auto";
        case QuoteMode::Never: return "never";
    }
    return "always";
}

} // namespace envfile
