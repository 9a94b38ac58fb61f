#include "envfile/cli/app.hpp"
#include "envfile/core/logger.hpp"

#include <filesystem>
#include <iostream>

// Version string; injected by CMake via -DENVFILE_VERSION_STRING=...
#ifndef ENVFILE_VERSION_STRING
#define ENVFILE_VERSION_STRING "0.1.0-dev"
#endif

namespace envfile::cli {

App::App()
    : cli_("Read, edit and apply .env files", "envfile")
{
    ctx_.out = &std::cout;
    ctx_.err = &std::cerr;

    cli_.set_version_flag("--version", ENVFILE_VERSION_STRING,
                          "Display version information");

    // Global option: config file path.
    cli_.add_option("-c,--config", config_path_,
                    "Path to configuration file (JSON)")
        ->envname("ENVFILE_CONFIG")
        ->check(CLI::ExistingFile);

    file_opt_ = cli_.add_option("-f,--file", file_,
                                "Location of the .env file (default: .env)");

    quote_opt_ = cli_.add_option("-q,--quote", quote_mode_,
                                 "Whether to quote values when writing")
        ->check(CLI::IsMember({"always", "never", "auto"}));

    cli_.add_flag("-e,--export", export_keys_,
                  "Prefix written lines with 'export '");

    cli_.add_flag("--no-interpolate", no_interpolate_,
                  "Report values without expanding ${...} references");

    cli_.add_flag("-v,--verbose", verbose_,
                  "Report a missing .env file");

    log_level_opt_ = cli_.add_option("--log-level", log_level_,
                                     "Log level (trace, debug, info, warn, error, critical)");

    // Require a subcommand.
    cli_.require_subcommand(1);

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli_.exit(e);
    }

    assemble_config();
    Logger::init("envfile", ctx_.config.log_level);

    if (!ctx_.action) {
        return 0;
    }
    int code = ctx_.action();
    Logger::flush();
    return code;
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::config() -> Config& {
    return ctx_.config;
}

auto App::config() const -> const Config& {
    return ctx_.config;
}

void App::setup_commands() {
    register_list_command(cli_, ctx_);
    register_get_command(cli_, ctx_);
    register_set_command(cli_, ctx_);
    register_unset_command(cli_, ctx_);
    register_run_command(cli_, ctx_);
}

void App::assemble_config() {
    if (!config_path_.empty()) {
        ctx_.config = load_config(std::filesystem::path(config_path_));
    } else {
        ctx_.config = load_config_from_env();
    }

    if (file_opt_->count() > 0) {
        ctx_.config.file = file_;
    }
    if (quote_opt_->count() > 0) {
        ctx_.config.quote_mode = parse_quote_mode(quote_mode_).value_or(QuoteMode::Always);
    }
    if (log_level_opt_->count() > 0) {
        ctx_.config.log_level = log_level_;
    }
    if (export_keys_) {
        ctx_.config.export_keys = true;
    }
    if (no_interpolate_) {
        ctx_.config.interpolate = false;
    }
    if (verbose_) {
        ctx_.config.verbose = true;
    }
}

} // namespace envfile::cli
