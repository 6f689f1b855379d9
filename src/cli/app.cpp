#include "hearthfs/cli/app.hpp"
#include "hearthfs/core/logger.hpp"

#include <filesystem>

// Version string; typically injected by CMake via -DHEARTHFS_VERSION_STRING=...
#ifndef HEARTHFS_VERSION_STRING
#define HEARTHFS_VERSION_STRING "0.1.0-dev"
#endif

namespace hearthfs::cli {

App::App()
    : cli_("hearthfs", "Sandboxed access to household application storage")
{
    cli_.set_version_flag("--version", HEARTHFS_VERSION_STRING,
                          "Display version information");

    // Global option: config file path.
    cli_.add_option("-c,--config", config_path_,
                    "Path to configuration file (JSON)")
        ->envname("HEARTHFS_CONFIG")
        ->check(CLI::ExistingFile);

    // Global option: log level override.
    cli_.add_option("--log-level", log_level_,
                    "Log level (trace, debug, info, warn, error, critical, off)");

    cli_.add_flag("-v,--verbose", ctx_.verbose,
                  "Include machine error codes in error output");

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

    // Configuration precedence: file < environment < command line.
    if (!config_path_.empty()) {
        ctx_.config = load_config(std::filesystem::path(config_path_));
    }
    apply_env_overrides(ctx_.config);
    if (!log_level_.empty()) {
        ctx_.config.log_level = log_level_;
    }

    Logger::init("hearthfs", ctx_.config.log_level);
    if (!config_path_.empty()) {
        LOG_INFO("Loaded configuration from: {}", config_path_);
    }

    for (const auto& command : commands_) {
        if (command.sub->parsed()) {
            return command.run();
        }
    }
    return 0;
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::config() const -> const Config& {
    return ctx_.config;
}

void App::setup_commands() {
    for (auto& command : register_file_commands(cli_, ctx_)) {
        commands_.push_back(std::move(command));
    }
    for (auto& command : register_path_commands(cli_, ctx_)) {
        commands_.push_back(std::move(command));
    }
    commands_.push_back(register_config_command(cli_, ctx_));
    commands_.push_back(register_version_command(cli_));
}

} // namespace hearthfs::cli
