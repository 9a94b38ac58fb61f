#include "envfile/cli/actions.hpp"
#include "envfile/core/logger.hpp"
#include "envfile/core/utils.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <ostream>
#include <sstream>
#include <vector>

#include <nlohmann/json.hpp>

#include <unistd.h>

namespace envfile::cli {

using json = nlohmann::json;

namespace {

auto report(std::ostream& err, const Error& error) -> int {
    err << "Error: " << error.what() << "\n";
    return 1;
}

} // anonymous namespace

auto parse_list_format(std::string_view s) -> std::optional<ListFormat> {
    auto v = utils::to_lower(s);
    if (v == "simple") return ListFormat::Simple;
    if (v == "json") return ListFormat::Json;
    if (v == "shell") return ListFormat::Shell;
    if (v == "export") return ListFormat::Export;
    return std::nullopt;
}

auto load_options(const Config& config) -> infra::LoadOptions {
    return infra::LoadOptions{
        .interpolate = config.interpolate,
        .override_existing = config.override_existing,
        .single_quotes_expand = config.single_quotes_expand,
        .verbose = config.verbose,
    };
}

auto list_values(const Config& config, ListFormat format,
                 std::ostream& out, std::ostream& err) -> int {
    auto text = infra::read_document(config.file);
    if (!text) return report(err, text.error());

    std::istringstream in(*text);
    auto resolved = infra::values(in, load_options(config));
    if (!resolved) return report(err, resolved.error());

    if (format == ListFormat::Json) {
        // json objects keep their keys sorted.
        json j = json::object();
        for (const auto& [key, value] : *resolved) {
            j[key] = value ? json(*value) : json(nullptr);
        }
        out << j.dump(2) << "\n";
        return 0;
    }

    std::vector<std::pair<std::string, std::string>> rows;
    for (const auto& [key, value] : *resolved) {
        if (value) rows.emplace_back(key, *value);
    }
    std::ranges::sort(rows);

    std::string_view prefix = format == ListFormat::Export ? "export " : "";
    bool quote = format == ListFormat::Shell || format == ListFormat::Export;
    for (const auto& [key, value] : rows) {
        out << prefix << key << "=" << (quote ? utils::shell_quote(value) : value) << "\n";
    }
    return 0;
}

auto get_value(const Config& config, std::string_view key,
               std::ostream& out, std::ostream& err) -> int {
    auto value = infra::get_key(config.file, key, load_options(config));
    if (!value) {
        if (value.error().code() == ErrorCode::KeyNotFound) return 1;
        return report(err, value.error());
    }
    if (!*value || (*value)->empty()) return 1;

    out << **value << "\n";
    return 0;
}

auto set_value(const Config& config, std::string_view key, std::string_view value,
               std::ostream& out, std::ostream& err) -> int {
    auto result = infra::set_key(config.file, key, value, config.quote_mode, config.export_keys);
    if (!result) return report(err, result.error());

    out << result->first << "=" << result->second << "\n";
    return 0;
}

auto unset_value(const Config& config, std::string_view key,
                 std::ostream& out, std::ostream& err) -> int {
    auto result = infra::unset_key(config.file, key);
    if (!result) return report(err, result.error());

    out << "Successfully removed " << *result << "\n";
    return 0;
}

auto run_command(const Config& config, bool override_existing,
                 const std::vector<std::string>& command, std::ostream& err) -> int {
    if (command.empty()) {
        err << "No command given.\n";
        return 1;
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(config.file, ec)) {
        err << "Invalid value for '-f' \"" << config.file << "\" does not exist.\n";
        return 1;
    }

    auto options = load_options(config);
    options.override_existing = override_existing;
    auto loaded = infra::load(config.file, options);
    if (!loaded) return report(err, loaded.error());

    std::vector<char*> argv;
    argv.reserve(command.size() + 1);
    for (const auto& arg : command) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    LOG_DEBUG("Executing {}", command.front());
    Logger::flush();
    ::execvp(argv[0], argv.data());

    err << "Error: cannot run " << command.front() << ": " << std::strerror(errno) << "\n";
    return 127;
}

} // namespace envfile::cli
