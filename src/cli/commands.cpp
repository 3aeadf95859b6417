#include "scriptsign/cli/commands.hpp"
#include "scriptsign/cli/report.hpp"
#include "scriptsign/core/logger.hpp"
#include "scriptsign/infra/paths.hpp"
#include "scriptsign/infra/ports.hpp"
#include "scriptsign/signing/orchestrator.hpp"
#include "scriptsign/signing/service.hpp"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>

#ifndef SCRIPTSIGN_VERSION_STRING
#define SCRIPTSIGN_VERSION_STRING "0.1.0-dev"
#endif

namespace scriptsign::cli {

namespace {

/// Resolves the config and initializes logging. On failure prints the error
/// and sets the exit code.
auto prepare(CommandContext& ctx) -> std::optional<Config> {
    auto config = effective_config(ctx.globals);
    if (!config) {
        print_error(std::cerr, config.error());
        ctx.exit_code = 1;
        return std::nullopt;
    }
    Logger::init("scriptsign", config->log_level);
    return std::move(*config);
}

auto fail(CommandContext& ctx, const Error& error) -> void {
    LOG_DEBUG("Command failed: [{}] {}", error_code_to_string(error.code()), error.what());
    print_error(std::cerr, error);
    ctx.exit_code = 1;
}

} // anonymous namespace

auto effective_config(const GlobalOptions& globals) -> Result<Config> {
    Config config = default_config();

    if (!globals.config_path.empty()) {
        auto loaded = load_config(globals.config_path);
        if (!loaded) {
            return std::unexpected(std::move(loaded.error()));
        }
        config = std::move(*loaded);
    } else if (auto path = infra::default_config_path(); std::filesystem::exists(path)) {
        auto loaded = load_config(path);
        if (!loaded) {
            return std::unexpected(std::move(loaded.error()));
        }
        config = std::move(*loaded);
    }

    config = load_config_from_env(std::move(config));

    if (!globals.service_url.empty()) {
        config.service.base_url = globals.service_url;
    }
    if (!globals.log_level.empty()) {
        config.log_level = globals.log_level;
    }

    if (auto valid = validate_config(config); !valid) {
        return std::unexpected(std::move(valid.error()));
    }
    return config;
}

// ---------------------------------------------------------------------------
// sign command
// ---------------------------------------------------------------------------

void register_sign_command(CLI::App& app, CommandContext& ctx) {
    auto* sub = app.add_subcommand(
        "sign", "Sign a script, then verify the signature");

    struct Options {
        std::string script;
        std::string thumbprint;
        std::string pfx;
        std::string pfx_password;
        std::string timestamp_server;
    };
    auto opts = std::make_shared<Options>();

    sub->add_option("script", opts->script, "Path to the script to sign")
        ->required();
    sub->add_option("-t,--thumbprint", opts->thumbprint,
                    "Thumbprint of a certificate in the service's store");
    sub->add_option("--pfx", opts->pfx, "Path to a PFX (PKCS#12) file");
    sub->add_option("--pfx-password", opts->pfx_password, "Password for the PFX file")
        ->envname("SCRIPTSIGN_PFX_PASSWORD");
    sub->add_option("--timestamp-server", opts->timestamp_server,
                    "RFC 3161 timestamp server URL");

    sub->callback([&ctx, opts]() {
        auto config = prepare(ctx);
        if (!config) return;

        signing::SignOptions options;
        options.script_path = opts->script;
        if (!opts->thumbprint.empty()) options.cert_thumbprint = opts->thumbprint;
        if (!opts->pfx.empty()) options.pfx_path = std::filesystem::path(opts->pfx);
        if (!opts->pfx_password.empty()) options.pfx_password = opts->pfx_password;
        if (!opts->timestamp_server.empty()) options.timestamp_server = opts->timestamp_server;

        LOG_DEBUG("Using signing service at {}", config->service.base_url);
        signing::HttpSigningService service(config->service);
        signing::Orchestrator orchestrator(service);

        auto result = orchestrator.run(options);
        ctx.exit_code = signing::exit_code_for(result);
        if (!result) {
            print_error(std::cerr, result.error());
            return;
        }

        if (const auto* choice = std::get_if<signing::CertificateChoiceRequired>(&*result)) {
            print_certificate_choice(std::cout, *choice);
        } else {
            print_signed(std::cout, std::cerr, std::get<signing::SignedOutcome>(*result));
        }
    });
}

// ---------------------------------------------------------------------------
// verify command
// ---------------------------------------------------------------------------

void register_verify_command(CLI::App& app, CommandContext& ctx) {
    auto* sub = app.add_subcommand("verify", "Verify the signature of a script");

    auto script = std::make_shared<std::string>();
    sub->add_option("script", *script, "Path to the script to verify")
        ->required();

    sub->callback([&ctx, script]() {
        auto config = prepare(ctx);
        if (!config) return;

        signing::HttpSigningService service(config->service);
        signing::Orchestrator orchestrator(service);

        auto result = orchestrator.verify(*script);
        if (!result) {
            fail(ctx, result.error());
            return;
        }
        print_verification(std::cout, std::filesystem::weakly_canonical(*script), *result);
        ctx.exit_code = 0;
    });
}

// ---------------------------------------------------------------------------
// certs command
// ---------------------------------------------------------------------------

void register_certs_command(CLI::App& app, CommandContext& ctx) {
    auto* sub = app.add_subcommand(
        "certs", "List code-signing certificates known to the service");

    sub->callback([&ctx]() {
        auto config = prepare(ctx);
        if (!config) return;

        signing::HttpSigningService service(config->service);
        signing::Orchestrator orchestrator(service);

        auto certs = orchestrator.list_certificates();
        if (!certs) {
            fail(ctx, certs.error());
            return;
        }
        print_certificates(std::cout, *certs);
        ctx.exit_code = 0;
    });
}

// ---------------------------------------------------------------------------
// status command
// ---------------------------------------------------------------------------

void register_status_command(CLI::App& app, CommandContext& ctx) {
    auto* sub = app.add_subcommand(
        "status", "Check that the signing service and its runtime are available");

    sub->callback([&ctx]() {
        auto config = prepare(ctx);
        if (!config) return;

        signing::HttpSigningService service(config->service);
        signing::Orchestrator orchestrator(service);

        if (auto live = orchestrator.check_service(); !live) {
            fail(ctx, live.error());
            return;
        }
        std::cout << "Signing service at " << service.base_url() << " is available\n";
        ctx.exit_code = 0;
    });
}

// ---------------------------------------------------------------------------
// find-port command
// ---------------------------------------------------------------------------

void register_find_port_command(CLI::App& app, CommandContext& ctx) {
    auto* sub = app.add_subcommand(
        "find-port", "Print the first TCP port in a range with no listener");

    struct Options {
        uint16_t start = 0;
        uint16_t end = 0;
        int timeout_ms = 0;
        bool strict = false;
    };
    auto opts = std::make_shared<Options>();

    sub->add_option("-s,--start", opts->start, "First port to try (default: 11000)")
        ->check(CLI::Range(1, 65535));
    sub->add_option("-e,--end", opts->end, "Last port to try (default: 12000)")
        ->check(CLI::Range(1, 65535));
    sub->add_option("--timeout-ms", opts->timeout_ms, "Per-port probe timeout")
        ->check(CLI::PositiveNumber);
    sub->add_flag("--strict", opts->strict,
                  "Skip ports whose probe timed out instead of reporting them free");

    sub->callback([&ctx, opts]() {
        auto config = prepare(ctx);
        if (!config) return;

        auto scan = config->ports;
        if (opts->start != 0) scan.start_port = opts->start;
        if (opts->end != 0) scan.end_port = opts->end;
        if (opts->timeout_ms > 0) scan.probe_timeout_ms = opts->timeout_ms;

        LOG_DEBUG("Scanning {}:{}-{} ({} ms per probe{})", scan.host, scan.start_port,
                  scan.end_port, scan.probe_timeout_ms, opts->strict ? ", strict" : "");

        auto port = opts->strict
            ? infra::find_available_port(scan, infra::skip_inconclusive)
            : infra::find_available_port(scan);
        if (!port) {
            std::cerr << "error: no available port in range " << scan.start_port
                      << "-" << scan.end_port << "\n";
            ctx.exit_code = 1;
            return;
        }
        std::cout << *port << "\n";
        ctx.exit_code = 0;
    });
}

// ---------------------------------------------------------------------------
// version command
// ---------------------------------------------------------------------------

void register_version_command(CLI::App& app) {
    auto* sub = app.add_subcommand("version", "Print version information");

    sub->callback([]() {
        std::cout << "scriptsign " << SCRIPTSIGN_VERSION_STRING << "\n";
        std::cout << "C++ standard: " << __cplusplus << "\n";
#if defined(__clang__)
        std::cout << "Compiler: clang " << __clang_major__ << "."
                  << __clang_minor__ << "." << __clang_patchlevel__ << "\n";
#elif defined(__GNUC__)
        std::cout << "Compiler: gcc " << __GNUC__ << "."
                  << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__ << "\n";
#else
        std::cout << "Compiler: unknown\n";
#endif
    });
}

} // namespace scriptsign::cli
