#pragma once

#include <filesystem>

#include "scriptsign/core/error.hpp"

namespace scriptsign::infra {

/// Returns the user's home directory.
auto home_dir() -> std::filesystem::path;

/// Returns the configuration directory for scriptsign.
/// Linux: $XDG_CONFIG_HOME/scriptsign or ~/.config/scriptsign
/// macOS: ~/Library/Application Support/scriptsign
auto config_dir() -> std::filesystem::path;

/// Returns `config_dir() / "config.json"`.
auto default_config_path() -> std::filesystem::path;

/// Canonicalizes `path` to an absolute path with symlinks resolved.
/// Fails with `missing_code` when the path does not exist or is not a
/// regular file.
auto resolve_existing_file(const std::filesystem::path& path, ErrorCode missing_code)
    -> Result<std::filesystem::path>;

} // namespace scriptsign::infra
