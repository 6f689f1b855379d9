#pragma once

#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "hearthfs/cli/commands.hpp"
#include "hearthfs/core/config.hpp"

namespace hearthfs::cli {

/// Top-level CLI application.
///
/// Parses command-line arguments using CLI11, loads configuration
/// (file, then HEARTHFS_* environment, then command-line overrides),
/// initializes logging and runs the selected subcommand.
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

    /// Access the effective configuration.
    [[nodiscard]] auto config() const -> const Config&;

private:
    /// Register all subcommands on the CLI11 app.
    void setup_commands();

    CLI::App cli_;
    CommandContext ctx_;
    std::vector<Command> commands_;
    std::string config_path_;
    std::string log_level_;
};

} // namespace hearthfs::cli
