#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "scriptsign/core/config.hpp"
#include "scriptsign/core/error.hpp"

namespace scriptsign::cli {

/// Options accepted by every subcommand.
struct GlobalOptions {
    std::string config_path;
    std::string log_level;
    std::string service_url;
};

/// State shared between the App and its subcommand callbacks.
struct CommandContext {
    GlobalOptions globals;
    int exit_code = 0;
};

/// Defaults, then the config file (explicit, or the default path if it
/// exists), then SCRIPTSIGN_* environment variables, then command-line
/// flags. The result is validated.
auto effective_config(const GlobalOptions& globals) -> Result<Config>;

/// Register the `sign` subcommand.
/// Signs a script, or lists certificates when no identity is given.
void register_sign_command(CLI::App& app, CommandContext& ctx);

/// Register the `verify` subcommand.
void register_verify_command(CLI::App& app, CommandContext& ctx);

/// Register the `certs` subcommand.
void register_certs_command(CLI::App& app, CommandContext& ctx);

/// Register the `status` subcommand.
/// Runs the signing service liveness probe.
void register_status_command(CLI::App& app, CommandContext& ctx);

/// Register the `find-port` subcommand.
/// Prints the first free TCP port in a range.
void register_find_port_command(CLI::App& app, CommandContext& ctx);

/// Register the `version` subcommand.
void register_version_command(CLI::App& app);

} // namespace scriptsign::cli
