#pragma once

#include <CLI/CLI.hpp>

#include "scriptsign/cli/commands.hpp"

namespace scriptsign::cli {

/// Top-level CLI application.
///
/// Parses command-line arguments using CLI11 and dispatches to the
/// registered subcommands (sign, verify, certs, status, find-port, version).
/// Global options may appear before or after the subcommand.
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

private:
    /// Register all subcommands on the CLI11 app.
    void setup_commands();

    CLI::App cli_;
    CommandContext ctx_;
};

} // namespace scriptsign::cli
