#pragma once

#include <array>
#include <string_view>

#include "hearthfs/core/error.hpp"

namespace hearthfs::sandbox {

/// Logical storage roots. Each maps to exactly one absolute base directory.
enum class RootKey {
    AppData,
    Attachments,  // <AppData>/attachments
    AppConfig,
    AppCache,
    AppLogs,
};

inline constexpr std::array<RootKey, 5> kAllRootKeys = {
    RootKey::AppData,
    RootKey::Attachments,
    RootKey::AppConfig,
    RootKey::AppCache,
    RootKey::AppLogs,
};

/// "appData", "attachments", "appConfig", "appCache", "appLogs".
auto root_key_to_string(RootKey key) -> std::string_view;

/// Exact, case-sensitive inverse of root_key_to_string().
/// Unknown names are rejected with ErrorCode::Invalid.
auto parse_root_key(std::string_view name) -> Result<RootKey>;

} // namespace hearthfs::sandbox
