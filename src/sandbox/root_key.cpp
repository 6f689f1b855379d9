#include "hearthfs/sandbox/root_key.hpp"

#include <string>

namespace hearthfs::sandbox {

auto root_key_to_string(RootKey key) -> std::string_view {
    switch (key) {
        case RootKey::AppData: return "appData";
        case RootKey::Attachments: return "attachments";
        case RootKey::AppConfig: return "appConfig";
        case RootKey::AppCache: return "appCache";
        case RootKey::AppLogs: return "appLogs";
    }
    return "unknown";
}

auto parse_root_key(std::string_view name) -> Result<RootKey> {
    for (auto key : kAllRootKeys) {
        if (root_key_to_string(key) == name) {
            return key;
        }
    }
    return std::unexpected(make_error(ErrorCode::Invalid,
        "Unknown root key", std::string(name)));
}

} // namespace hearthfs::sandbox
