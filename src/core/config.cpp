#include "scriptsign/core/config.hpp"
#include "scriptsign/core/logger.hpp"

#include <cstdlib>
#include <fstream>

namespace scriptsign {

namespace {

void resolve_env_refs_in_place(json& j) {
    if (j.is_string()) {
        j = resolve_env_refs(j.get<std::string>());
    } else if (j.is_object() || j.is_array()) {
        for (auto& elem : j) {
            resolve_env_refs_in_place(elem);
        }
    }
}

} // anonymous namespace

auto load_config(const std::filesystem::path& path) -> Result<Config> {
    if (!std::filesystem::exists(path)) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig, "Config file not found", path.string()));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(make_error(
            ErrorCode::IoError, "Cannot open config file", path.string()));
    }

    try {
        json j = json::parse(file);
        if (!j.is_object()) {
            return std::unexpected(make_error(
                ErrorCode::InvalidConfig, "Config root must be a JSON object",
                path.string()));
        }
        resolve_env_refs_in_place(j);
        LOG_DEBUG("Loaded config from {}", path.string());
        return j.get<Config>();
    } catch (const json::exception& e) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig, "Failed to parse config", e.what()));
    }
}

auto load_config_from_env(Config base) -> Config {
    if (auto* val = std::getenv("SCRIPTSIGN_SERVICE_URL"); val && *val) {
        base.service.base_url = val;
    }
    if (auto* val = std::getenv("SCRIPTSIGN_LOG_LEVEL"); val && *val) {
        base.log_level = val;
    }
    return base;
}

auto default_config() -> Config {
    return Config{};
}

auto validate_config(const Config& config) -> VoidResult {
    const auto& url = config.service.base_url;
    if (!url.starts_with("http://") && !url.starts_with("https://")) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig,
            "service.base_url must start with http:// or https://", url));
    }
    if (config.service.liveness_timeout_ms <= 0) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig, "service.liveness_timeout_ms must be positive"));
    }
    if (config.service.request_timeout_seconds <= 0) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig, "service.request_timeout_seconds must be positive"));
    }
    for (auto port : {config.ports.start_port, config.ports.end_port}) {
        if (port < 1 || port > 65535) {
            return std::unexpected(make_error(
                ErrorCode::InvalidConfig, "ports must be in the range 1-65535",
                std::to_string(port)));
        }
    }
    if (config.ports.probe_timeout_ms <= 0) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig, "ports.probe_timeout_ms must be positive"));
    }
    if (config.ports.host.empty()) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig, "ports.host must not be empty"));
    }
    return {};
}

auto resolve_env_refs(std::string_view input) -> std::string {
    std::string result;
    result.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        // $${VAR} -> literal ${VAR}
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '$') {
            result += '$';
            i += 2;
            continue;
        }

        if (i + 2 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            auto close = input.find('}', i + 2);
            if (close != std::string_view::npos) {
                std::string var_name(input.substr(i + 2, close - i - 2));

                if (auto* val = std::getenv(var_name.c_str())) {
                    result += val;
                } else {
                    // Preserve unresolved refs
                    result += input.substr(i, close - i + 1);
                    LOG_DEBUG("Config: unresolved env ref ${{{}}}", var_name);
                }
                i = close + 1;
                continue;
            }
        }

        result += input[i];
        ++i;
    }

    return result;
}

} // namespace scriptsign
