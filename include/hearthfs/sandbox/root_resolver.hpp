#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "hearthfs/core/error.hpp"
#include "hearthfs/sandbox/providers.hpp"
#include "hearthfs/sandbox/root_key.hpp"

namespace hearthfs::sandbox {

/// Maps a RootKey to its absolute base directory.
///
/// Bases use forward slashes and always end with '/'. The Attachments root
/// is the AppData base joined with `attachments_dir`. Successful lookups
/// are cached for the lifetime of the resolver; provider failures are not.
class RootResolver {
public:
    explicit RootResolver(std::shared_ptr<PathProvider> provider,
                          std::string attachments_dir = "attachments");

    RootResolver(const RootResolver&) = delete;
    RootResolver& operator=(const RootResolver&) = delete;

    [[nodiscard]] auto resolve_base(RootKey key) -> Result<std::string>;

    /// Drops all cached bases; the next lookup queries the provider again.
    void clear_cache();

private:
    auto compute_base(RootKey key) -> Result<std::string>;

    std::shared_ptr<PathProvider> provider_;
    std::string attachments_dir_;
    std::mutex mutex_;
    std::unordered_map<RootKey, std::string> cache_;
};

/// Converts a provider directory into base form: backslashes become '/',
/// a drive letter is upper-cased and a trailing '/' is appended. Empty,
/// relative or ".."-containing directories are rejected with
/// ErrorCode::Invalid.
auto normalize_base_dir(std::string_view dir) -> Result<std::string>;

} // namespace hearthfs::sandbox
