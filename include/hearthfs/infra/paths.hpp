#pragma once

#include <filesystem>
#include <string_view>

namespace hearthfs::infra {

/// Returns the per-application data directory.
/// Linux: $XDG_DATA_HOME/<app> or ~/.local/share/<app>
/// macOS: ~/Library/Application Support/<app>
/// Windows: %LOCALAPPDATA%\<app>\data
auto data_dir(std::string_view app_name) -> std::filesystem::path;

/// Returns the per-application configuration directory.
/// Linux: $XDG_CONFIG_HOME/<app> or ~/.config/<app>
/// macOS: ~/Library/Preferences/<app>
auto config_dir(std::string_view app_name) -> std::filesystem::path;

/// Returns the per-application cache directory.
/// Linux: $XDG_CACHE_HOME/<app> or ~/.cache/<app>
/// macOS: ~/Library/Caches/<app>
auto cache_dir(std::string_view app_name) -> std::filesystem::path;

/// Returns the per-application logs directory.
/// Linux: $XDG_STATE_HOME/<app>/logs or ~/.local/state/<app>/logs
/// macOS: ~/Library/Logs/<app>
auto logs_dir(std::string_view app_name) -> std::filesystem::path;

/// Returns the user's home directory.
auto home_dir() -> std::filesystem::path;

} // namespace hearthfs::infra
