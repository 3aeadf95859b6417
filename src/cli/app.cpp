#include "scriptsign/cli/app.hpp"
#include "scriptsign/core/logger.hpp"

// Version string; typically injected by CMake via -DSCRIPTSIGN_VERSION_STRING=...
#ifndef SCRIPTSIGN_VERSION_STRING
#define SCRIPTSIGN_VERSION_STRING "0.1.0-dev"
#endif

namespace scriptsign::cli {

App::App()
    : cli_("scriptsign", "Sign and verify scripts through a local code-signing service")
{
    cli_.set_version_flag("--version", SCRIPTSIGN_VERSION_STRING,
                          "Display version information");

    cli_.add_option("-c,--config", ctx_.globals.config_path,
                    "Path to configuration file (JSON)")
        ->envname("SCRIPTSIGN_CONFIG")
        ->check(CLI::ExistingFile);

    cli_.add_option("--log-level", ctx_.globals.log_level,
                    "Log level (trace, debug, info, warn, error, critical)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical"}));

    cli_.add_option("-u,--service-url", ctx_.globals.service_url,
                    "Signing service base URL (default: http://localhost:20000)");

    // Let subcommands accept the global options too.
    cli_.fallthrough();
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

    // The selected subcommand's callback ran inside parse() and recorded
    // its exit code.
    Logger::flush();
    return ctx_.exit_code;
}

void App::setup_commands() {
    register_sign_command(cli_, ctx_);
    register_verify_command(cli_, ctx_);
    register_certs_command(cli_, ctx_);
    register_status_command(cli_, ctx_);
    register_find_port_command(cli_, ctx_);
    register_version_command(cli_);
}

} // namespace scriptsign::cli
