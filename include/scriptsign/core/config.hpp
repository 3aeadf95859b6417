#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "scriptsign/core/error.hpp"

namespace scriptsign {

using json = nlohmann::json;

constexpr auto kDefaultServiceUrl = "http://localhost:20000";

struct ServiceConfig {
    std::string base_url = kDefaultServiceUrl;
    int liveness_timeout_ms = 2000;
    int request_timeout_seconds = 120;  // sign and verify may take a while
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ServiceConfig, base_url, liveness_timeout_ms, request_timeout_seconds)

// Ports are read as int so that out-of-range values reach validate_config
// instead of wrapping around in a narrowing conversion.
struct PortScanConfig {
    int start_port = 11000;
    int end_port = 12000;
    int probe_timeout_ms = 200;
    std::string host = "localhost";
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(PortScanConfig, start_port, end_port, probe_timeout_ms, host)

struct Config {
    ServiceConfig service;
    PortScanConfig ports;
    std::string log_level = "info";
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, service, ports, log_level)

/// Loads a JSON config file on top of the defaults. `${VAR}` references in
/// string values are expanded before parsing into Config.
auto load_config(const std::filesystem::path& path) -> Result<Config>;

/// Applies SCRIPTSIGN_* environment overrides to `base`.
auto load_config_from_env(Config base = {}) -> Config;

auto default_config() -> Config;

/// Checks ranges and URL shape. Returns InvalidConfig on the first problem.
auto validate_config(const Config& config) -> VoidResult;

/// Resolves `${VAR}` environment variable references in a string.
/// Supports `$${VAR}` escape (literal `${VAR}`).
auto resolve_env_refs(std::string_view input) -> std::string;

} // namespace scriptsign
