#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>

#include "hearthfs/core/config.hpp"
#include "hearthfs/core/error.hpp"
#include "hearthfs/sandbox/file_system.hpp"
#include "hearthfs/sandbox/providers.hpp"
#include "hearthfs/sandbox/safe_file_ops.hpp"
#include "hearthfs/sandbox/sandbox_context.hpp"

namespace hearthfs::sandbox {

/// Special directories from infra/paths (XDG, macOS Library, Windows
/// LOCALAPPDATA), with the app-data directory overridable by config.
class PlatformPathProvider : public PathProvider {
public:
    explicit PlatformPathProvider(SandboxConfig config);

    auto special_dir(SpecialDir dir) -> Result<std::string> override;

private:
    SandboxConfig config_;
};

/// std::filesystem / lstat(2) implementation of the filesystem primitives
/// and of link metadata. Performs no path validation.
class LocalFileSystem : public FileSystem, public MetadataProvider {
public:
    auto read_text_file(const std::string& path) -> awaitable<Result<std::string>> override;
    auto write_text_file(const std::string& path, const std::string& data)
        -> awaitable<Result<void>> override;
    auto list_directory(const std::string& path)
        -> awaitable<Result<std::vector<DirEntry>>> override;
    auto create_directory(const std::string& path, bool recursive)
        -> awaitable<Result<void>> override;
    auto remove(const std::string& path, bool recursive) -> awaitable<Result<void>> override;
    auto lstat(const std::string& path) -> awaitable<Result<LinkMetadata>> override;

    auto symlink_metadata(const std::string& path) -> Result<LinkMetadata> override;
};

/// Maps an errno value to NotFound / AlreadyExists / Forbidden / IoError.
auto errno_to_error(int err, std::string_view operation, const std::string& path) -> Error;

/// Production wiring: PlatformPathProvider + LocalFileSystem behind the
/// default SandboxPathPolicy.
auto make_platform_file_ops(const SandboxConfig& config) -> std::shared_ptr<SafeFileOps>;

} // namespace hearthfs::sandbox
