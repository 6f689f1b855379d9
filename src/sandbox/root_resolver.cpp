#include "hearthfs/sandbox/root_resolver.hpp"

#include <cctype>

#include "hearthfs/core/logger.hpp"
#include "hearthfs/core/utils.hpp"
#include "hearthfs/sandbox/path_sanitizer.hpp"

namespace hearthfs::sandbox {

namespace {

auto special_dir_for(RootKey key) -> SpecialDir {
    switch (key) {
        case RootKey::AppData:
        case RootKey::Attachments:
            return SpecialDir::AppData;
        case RootKey::AppConfig: return SpecialDir::AppConfig;
        case RootKey::AppCache: return SpecialDir::AppCache;
        case RootKey::AppLogs: return SpecialDir::AppLogs;
    }
    return SpecialDir::AppData;
}

auto is_absolute_dir(std::string_view dir) -> bool {
    if (dir.starts_with('/')) return true;
    return dir.size() >= 3 &&
        std::isalpha(static_cast<unsigned char>(dir[0])) != 0 &&
        dir[1] == ':' && dir[2] == '/';
}

} // anonymous namespace

auto normalize_base_dir(std::string_view dir) -> Result<std::string> {
    auto base = utils::replace_all(dir, '\\', '/');
    if (base.empty() || !is_absolute_dir(base)) {
        return std::unexpected(make_error(ErrorCode::Invalid,
            "Root directory must be absolute", base));
    }
    for (const auto& segment : utils::split(base, '/')) {
        if (segment == "..") {
            return std::unexpected(make_error(ErrorCode::Invalid,
                "Root directory may not contain parent segments", base));
        }
    }
    if (base[0] != '/') {
        base[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(base[0])));
    }
    if (!base.ends_with('/')) {
        base += '/';
    }
    return base;
}

RootResolver::RootResolver(std::shared_ptr<PathProvider> provider,
                           std::string attachments_dir)
    : provider_(std::move(provider))
    , attachments_dir_(std::move(attachments_dir)) {}

auto RootResolver::resolve_base(RootKey key) -> Result<std::string> {
    {
        std::lock_guard lock(mutex_);
        if (auto it = cache_.find(key); it != cache_.end()) {
            return it->second;
        }
    }

    auto base = compute_base(key);
    if (!base) {
        return base;
    }

    std::lock_guard lock(mutex_);
    auto [it, inserted] = cache_.emplace(key, std::move(*base));
    if (inserted) {
        LOG_DEBUG("Resolved root {} to {}", root_key_to_string(key), it->second);
    }
    return it->second;
}

void RootResolver::clear_cache() {
    std::lock_guard lock(mutex_);
    cache_.clear();
}

auto RootResolver::compute_base(RootKey key) -> Result<std::string> {
    if (!provider_) {
        return std::unexpected(make_error(ErrorCode::InternalError,
            "No path provider configured"));
    }

    auto dir = provider_->special_dir(special_dir_for(key));
    if (!dir) {
        LOG_ERROR("Failed to resolve root {}: {}", root_key_to_string(key), dir.error().what());
        return std::unexpected(dir.error());
    }

    auto base = normalize_base_dir(*dir);
    if (!base) {
        return base;
    }

    if (key == RootKey::Attachments) {
        auto sub = sanitize_relative_path(attachments_dir_);
        if (!sub) {
            return std::unexpected(make_error(ErrorCode::InvalidConfig,
                "Invalid attachments directory name", attachments_dir_));
        }
        *base += *sub + "/";
    }
    return base;
}

} // namespace hearthfs::sandbox
