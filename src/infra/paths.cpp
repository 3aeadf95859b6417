#include "scriptsign/infra/paths.hpp"
#include "scriptsign/core/logger.hpp"

#include <cstdlib>
#include <system_error>

#ifdef _WIN32
#include <windows.h>
#elif defined(__APPLE__) || defined(__linux__)
#include <sys/types.h>
#include <pwd.h>
#include <unistd.h>
#endif

namespace scriptsign::infra {

namespace fs = std::filesystem;

auto home_dir() -> fs::path {
#ifdef _WIN32
    if (const auto* home = std::getenv("USERPROFILE"); home && *home) {
        return fs::path(home);
    }
    const auto* drive = std::getenv("HOMEDRIVE");
    const auto* hpath = std::getenv("HOMEPATH");
    if (drive && hpath) {
        return fs::path(std::string(drive) + hpath);
    }
    return fs::path("C:\\Users\\Default");
#else
    if (const auto* home = std::getenv("HOME"); home && *home) {
        return fs::path(home);
    }

#if defined(__APPLE__) || defined(__linux__)
    if (const auto* pw = ::getpwuid(::getuid()); pw && pw->pw_dir) {
        return fs::path(pw->pw_dir);
    }
#endif

    return fs::path("/tmp");
#endif
}

auto config_dir() -> fs::path {
#ifdef _WIN32
    if (const auto* appdata = std::getenv("LOCALAPPDATA"); appdata && *appdata) {
        return fs::path(appdata) / "scriptsign";
    }
    return home_dir() / "AppData" / "Local" / "scriptsign";
#elif defined(__APPLE__)
    return home_dir() / "Library" / "Application Support" / "scriptsign";
#else
    if (const auto* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return fs::path(xdg) / "scriptsign";
    }
    return home_dir() / ".config" / "scriptsign";
#endif
}

auto default_config_path() -> fs::path {
    return config_dir() / "config.json";
}

auto resolve_existing_file(const fs::path& path, ErrorCode missing_code)
    -> Result<fs::path> {
    if (path.empty()) {
        return std::unexpected(make_error(missing_code, "No path given"));
    }

    std::error_code ec;
    auto resolved = fs::canonical(path, ec);
    if (ec) {
        return std::unexpected(make_error(
            missing_code, "File not found: " + path.string(), ec.message()));
    }

    if (!fs::is_regular_file(resolved, ec)) {
        return std::unexpected(make_error(
            missing_code, "Not a regular file: " + resolved.string()));
    }

    LOG_DEBUG("Resolved {} -> {}", path.string(), resolved.string());
    return resolved;
}

} // namespace scriptsign::infra
