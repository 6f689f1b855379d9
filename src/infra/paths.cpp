#include "hearthfs/infra/paths.hpp"

#include <cstdlib>
#include <string>

#if defined(__APPLE__) || defined(__linux__)
#include <sys/types.h>
#include <pwd.h>
#include <unistd.h>
#endif

namespace hearthfs::infra {

namespace fs = std::filesystem;

namespace {

#ifdef _WIN32
auto local_app_data() -> fs::path {
    if (const auto* appdata = std::getenv("LOCALAPPDATA"); appdata && *appdata) {
        return fs::path(appdata);
    }
    return home_dir() / "AppData" / "Local";
}
#endif

#if !defined(_WIN32) && !defined(__APPLE__)
/// $<var>/<app> when the XDG variable is set to an absolute path,
/// otherwise ~/<fallback>/<app>.
auto xdg_dir(const char* var, const fs::path& fallback, std::string_view app_name) -> fs::path {
    if (const auto* xdg = std::getenv(var); xdg && *xdg) {
        fs::path p(xdg);
        // The XDG spec says relative values must be ignored.
        if (p.is_absolute()) {
            return p / std::string(app_name);
        }
    }
    return home_dir() / fallback / std::string(app_name);
}
#endif

} // anonymous namespace

auto home_dir() -> fs::path {
#ifdef _WIN32
    // Try USERPROFILE first (standard on Windows)
    if (const auto* home = std::getenv("USERPROFILE"); home && *home) {
        return fs::path(home);
    }
    // Fall back to HOMEDRIVE + HOMEPATH
    const auto* drive = std::getenv("HOMEDRIVE");
    const auto* hpath = std::getenv("HOMEPATH");
    if (drive && hpath) {
        return fs::path(std::string(drive) + hpath);
    }
    return fs::path("C:\\Users\\Default");
#else
    // Try HOME environment variable first
    if (const auto* home = std::getenv("HOME"); home && *home) {
        return fs::path(home);
    }

    // Fall back to passwd entry
#if defined(__APPLE__) || defined(__linux__)
    if (const auto* pw = ::getpwuid(::getuid()); pw && pw->pw_dir) {
        return fs::path(pw->pw_dir);
    }
#endif

    // Last resort
    return fs::path("/tmp");
#endif
}

auto data_dir(std::string_view app_name) -> fs::path {
#ifdef _WIN32
    return local_app_data() / std::string(app_name) / "data";
#elif defined(__APPLE__)
    return home_dir() / "Library" / "Application Support" / std::string(app_name);
#else
    return xdg_dir("XDG_DATA_HOME", fs::path(".local") / "share", app_name);
#endif
}

auto config_dir(std::string_view app_name) -> fs::path {
#ifdef _WIN32
    return local_app_data() / std::string(app_name) / "config";
#elif defined(__APPLE__)
    return home_dir() / "Library" / "Preferences" / std::string(app_name);
#else
    return xdg_dir("XDG_CONFIG_HOME", ".config", app_name);
#endif
}

auto cache_dir(std::string_view app_name) -> fs::path {
#ifdef _WIN32
    return local_app_data() / std::string(app_name) / "cache";
#elif defined(__APPLE__)
    return home_dir() / "Library" / "Caches" / std::string(app_name);
#else
    return xdg_dir("XDG_CACHE_HOME", ".cache", app_name);
#endif
}

auto logs_dir(std::string_view app_name) -> fs::path {
#ifdef _WIN32
    return local_app_data() / std::string(app_name) / "logs";
#elif defined(__APPLE__)
    return home_dir() / "Library" / "Logs" / std::string(app_name);
#else
    return xdg_dir("XDG_STATE_HOME", fs::path(".local") / "state", app_name) / "logs";
#endif
}

} // namespace hearthfs::infra
