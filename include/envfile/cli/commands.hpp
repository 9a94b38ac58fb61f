#pragma once

#include <functional>
#include <iosfwd>

#include <CLI/CLI.hpp>

#include "envfile/core/config.hpp"

namespace envfile::cli {

/// State shared between the top-level app and its subcommands.
///
/// Subcommand callbacks run while CLI11 is still parsing, before the
/// configuration is complete, so they only record `action`; the app runs
/// it once the configuration has been assembled.
struct CommandContext {
    Config config;
    std::function<int()> action;
    std::ostream* out = nullptr;
    std::ostream* err = nullptr;
};

/// Register the `list` subcommand.
/// Prints every resolved value of the document.
void register_list_command(CLI::App& app, CommandContext& ctx);

/// Register the `get` subcommand.
/// Prints the resolved value of one key.
void register_get_command(CLI::App& app, CommandContext& ctx);

/// Register the `set` subcommand.
/// Adds or replaces one key in the document.
void register_set_command(CLI::App& app, CommandContext& ctx);

/// Register the `unset` subcommand.
/// Removes one key from the document.
void register_unset_command(CLI::App& app, CommandContext& ctx);

/// Register the `run` subcommand.
/// Loads the document into the environment and executes a command.
void register_run_command(CLI::App& app, CommandContext& ctx);

} // namespace envfile::cli
