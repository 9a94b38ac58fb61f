#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "envfile/core/types.hpp"

namespace envfile {

/// Settings shared by the CLI and the document file layer.
struct Config {
    std::string file = ".env";
    QuoteMode quote_mode = QuoteMode::Always;
    bool export_keys = false;
    bool interpolate = true;
    bool override_existing = false;
    bool single_quotes_expand = false;
    bool verbose = false;
    std::string log_level = "warn";
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, file, quote_mode, export_keys, interpolate, override_existing, single_quotes_expand, verbose, log_level)

/// Load a JSON config file. A missing or malformed file is logged and the
/// defaults are returned.
auto load_config(const std::filesystem::path& path) -> Config;

/// Defaults overridden by ENVFILE_FILE, ENVFILE_QUOTE_MODE, ENVFILE_EXPORT,
/// ENVFILE_INTERPOLATE, ENVFILE_OVERRIDE and ENVFILE_LOG_LEVEL.
auto load_config_from_env() -> Config;

auto default_config() -> Config;

} // namespace envfile
