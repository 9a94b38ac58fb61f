#pragma once

#include <optional>
#include <string_view>

#include <nlohmann/json.hpp>

namespace envfile {

using json = nlohmann::json;

/// How the serializer quotes a value when writing a line.
enum class QuoteMode {
    Always,  // always wrap in single quotes
    Auto,    // quote unless the value is purely alphanumeric
    Never,   // write verbatim
};

NLOHMANN_JSON_SERIALIZE_ENUM(QuoteMode, {
    {QuoteMode::Always, "always"},
    {QuoteMode::Auto, "auto"},
    {QuoteMode::Never, "never"},
})

auto parse_quote_mode(std::string_view s) -> std::optional<QuoteMode>;
auto quote_mode_to_string(QuoteMode mode) -> std::string_view;

} // namespace envfile
