#include "envfile/cli/commands.hpp"
#include "envfile/cli/actions.hpp"

#include <memory>
#include <string>
#include <vector>

namespace envfile::cli {

// ---------------------------------------------------------------------------
// list command
// ---------------------------------------------------------------------------

void register_list_command(CLI::App& app, CommandContext& ctx) {
    auto* sub = app.add_subcommand("list", "Display all the stored key/value pairs");

    auto format = std::make_shared<std::string>("simple");
    sub->add_option("--format", *format, "Output format")
        ->check(CLI::IsMember({"simple", "json", "shell", "export"}))
        ->capture_default_str();

    sub->callback([&ctx, format]() {
        ctx.action = [&ctx, format]() {
            auto parsed = parse_list_format(*format).value_or(ListFormat::Simple);
            return list_values(ctx.config, parsed, *ctx.out, *ctx.err);
        };
    });
}

// ---------------------------------------------------------------------------
// get command
// ---------------------------------------------------------------------------

void register_get_command(CLI::App& app, CommandContext& ctx) {
    auto* sub = app.add_subcommand("get", "Retrieve the value for the given key");

    auto key = std::make_shared<std::string>();
    sub->add_option("key", *key, "Key to look up")->required();

    sub->callback([&ctx, key]() {
        ctx.action = [&ctx, key]() {
            return get_value(ctx.config, *key, *ctx.out, *ctx.err);
        };
    });
}

// ---------------------------------------------------------------------------
// set command
// ---------------------------------------------------------------------------

void register_set_command(CLI::App& app, CommandContext& ctx) {
    auto* sub = app.add_subcommand("set", "Store the given key/value");

    auto key = std::make_shared<std::string>();
    auto value = std::make_shared<std::string>();
    sub->add_option("key", *key, "Key to store")->required();
    sub->add_option("value", *value, "Value to store")->required();

    sub->callback([&ctx, key, value]() {
        ctx.action = [&ctx, key, value]() {
            return set_value(ctx.config, *key, *value, *ctx.out, *ctx.err);
        };
    });
}

// ---------------------------------------------------------------------------
// unset command
// ---------------------------------------------------------------------------

void register_unset_command(CLI::App& app, CommandContext& ctx) {
    auto* sub = app.add_subcommand("unset", "Remove the given key");

    auto key = std::make_shared<std::string>();
    sub->add_option("key", *key, "Key to remove")->required();

    sub->callback([&ctx, key]() {
        ctx.action = [&ctx, key]() {
            return unset_value(ctx.config, *key, *ctx.out, *ctx.err);
        };
    });
}

// ---------------------------------------------------------------------------
// run command
// ---------------------------------------------------------------------------

void register_run_command(CLI::App& app, CommandContext& ctx) {
    auto* sub = app.add_subcommand("run", "Run a command with the document loaded into its environment");

    // Unlike the library default, `run` lets the document win by default.
    auto override_existing = std::make_shared<bool>(true);

    sub->add_flag("--override,!--no-override", *override_existing,
                  "Override variables already present in the environment");
    // The first positional argument and everything after it is the command.
    sub->prefix_command();

    sub->callback([&ctx, sub, override_existing]() {
        auto command = sub->remaining();
        ctx.action = [&ctx, override_existing, command = std::move(command)]() {
            return run_command(ctx.config, *override_existing, command, *ctx.err);
        };
    });
}

} // namespace envfile::cli
