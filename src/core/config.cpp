#include "envfile/core/config.hpp"
#include "envfile/core/logger.hpp"
#include "envfile/core/utils.hpp"

#include <cstdlib>
#include <fstream>

namespace envfile {

auto load_config(const std::filesystem::path& path) -> Config {
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, using defaults", path.string());
        return default_config();
    }

    try {
        json j = json::parse(file);

        // An unknown quote mode would silently map to the first enumerator.
        if (j.contains("quote_mode") && j["quote_mode"].is_string()) {
            auto mode = j["quote_mode"].get<std::string>();
            if (!parse_quote_mode(mode)) {
                LOG_WARN("Config: unknown quote_mode '{}', using 'always'", mode);
                j.erase("quote_mode");
            }
        }

        return j.get<Config>();
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config: {}", e.what());
        return default_config();
    }
}

auto load_config_from_env() -> Config {
    Config config;

    if (auto* val = std::getenv("ENVFILE_FILE")) {
        config.file = val;
    }
    if (auto* val = std::getenv("ENVFILE_QUOTE_MODE")) {
        if (auto mode = parse_quote_mode(val)) {
            config.quote_mode = *mode;
        } else {
            LOG_WARN("ENVFILE_QUOTE_MODE: unknown quote mode '{}'", val);
        }
    }
    if (auto* val = std::getenv("ENVFILE_EXPORT")) {
        config.export_keys = utils::parse_bool(val, config.export_keys);
    }
    if (auto* val = std::getenv("ENVFILE_INTERPOLATE")) {
        config.interpolate = utils::parse_bool(val, config.interpolate);
    }
    if (auto* val = std::getenv("ENVFILE_OVERRIDE")) {
        config.override_existing = utils::parse_bool(val, config.override_existing);
    }
    if (auto* val = std::getenv("ENVFILE_LOG_LEVEL")) {
        config.log_level = val;
    }

    return config;
}

auto default_config() -> Config {
    return Config{};
}

} // namespace envfile
