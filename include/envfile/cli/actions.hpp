#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "envfile/core/config.hpp"
#include "envfile/infra/dotenv.hpp"

namespace envfile::cli {

/// Output style of `envfile list`.
enum class ListFormat {
    Simple,  // KEY=value
    Json,    // one JSON object, keys sorted
    Shell,   // KEY='shell quoted'
    Export,  // export KEY='shell quoted'
};

auto parse_list_format(std::string_view s) -> std::optional<ListFormat>;

auto load_options(const Config& config) -> infra::LoadOptions;

// Each action returns the process exit code: 0 on success, 1 on failure
// (reported on `err`).

auto list_values(const Config& config, ListFormat format,
                 std::ostream& out, std::ostream& err) -> int;

/// Print the value of `key`. Missing or empty values exit with 1.
auto get_value(const Config& config, std::string_view key,
               std::ostream& out, std::ostream& err) -> int;

auto set_value(const Config& config, std::string_view key, std::string_view value,
               std::ostream& out, std::ostream& err) -> int;

auto unset_value(const Config& config, std::string_view key,
                 std::ostream& out, std::ostream& err) -> int;

/// Load the document into the environment and replace the current process
/// with `command`. Only returns on failure.
auto run_command(const Config& config, bool override_existing,
                 const std::vector<std::string>& command, std::ostream& err) -> int;

} // namespace envfile::cli
