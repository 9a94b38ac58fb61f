#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "envfile/cli/commands.hpp"
#include "envfile/core/config.hpp"

namespace envfile::cli {

/// Top-level CLI application.
///
/// Parses command-line arguments using CLI11, assembles the configuration
/// (JSON file or ENVFILE_* variables, then command-line flags) and runs the
/// selected subcommand (list, get, set, unset, run).
class App {
public:
    App();
    ~App();

    // Non-copyable, non-movable.
    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Parse arguments and execute the selected subcommand.
    /// @returns Process exit code (0 on success).
    auto run(int argc, char** argv) -> int;

    /// Access the underlying CLI11 app (for testing or extension).
    [[nodiscard]] auto cli() -> CLI::App&;

    /// Access the assembled configuration.
    [[nodiscard]] auto config() -> Config&;
    [[nodiscard]] auto config() const -> const Config&;

private:
    /// Register all subcommands on the CLI11 app.
    void setup_commands();

    /// Build ctx_.config from the config file or environment, then apply
    /// the flags given on the command line.
    void assemble_config();

    CLI::App cli_;
    CommandContext ctx_;
    std::string config_path_;
    std::string file_;
    std::string quote_mode_;
    std::string log_level_;
    bool export_keys_ = false;
    bool verbose_ = false;
    bool no_interpolate_ = false;

    CLI::Option* file_opt_ = nullptr;
    CLI::Option* quote_opt_ = nullptr;
    CLI::Option* log_level_opt_ = nullptr;
};

} // namespace envfile::cli
