#pragma once

#include <functional>
#include <vector>

#include <CLI/CLI.hpp>

#include "hearthfs/core/config.hpp"

namespace hearthfs::cli {

/// State shared by all subcommands; filled in by App before dispatch.
struct CommandContext {
    Config config;
    bool verbose = false;
};

/// A registered subcommand and the action to run when it was selected.
struct Command {
    CLI::App* sub = nullptr;
    std::function<int()> run;
};

/// File commands over the sandbox: read, write, ls, mkdir, rm, exists.
auto register_file_commands(CLI::App& app, CommandContext& ctx) -> std::vector<Command>;

/// Register the `sanitize` and `resolve` path inspection subcommands.
auto register_path_commands(CLI::App& app, CommandContext& ctx) -> std::vector<Command>;

/// Register the `config` subcommand.
/// Prints the effective configuration as JSON.
auto register_config_command(CLI::App& app, CommandContext& ctx) -> Command;

/// Register the `version` subcommand.
auto register_version_command(CLI::App& app) -> Command;

} // namespace hearthfs::cli
