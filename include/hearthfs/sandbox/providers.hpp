#pragma once

#include <string>

#include "hearthfs/core/error.hpp"

namespace hearthfs::sandbox {

/// OS-conventional special directories an application may own.
enum class SpecialDir {
    AppData,
    AppConfig,
    AppCache,
    AppLogs,
};

/// Supplies absolute special directories. Production code uses
/// PlatformPathProvider; tests inject fixed paths.
class PathProvider {
public:
    virtual ~PathProvider() = default;

    virtual auto special_dir(SpecialDir dir) -> Result<std::string> = 0;
};

/// Link metadata for one directory entry, as seen without following a
/// final symbolic link.
struct LinkMetadata {
    bool is_symlink = false;
    bool is_directory = false;
    bool is_regular_file = false;
};

/// lstat-equivalent query. A missing entry is reported as
/// ErrorCode::NotFound; other failures as Forbidden or IoError.
class MetadataProvider {
public:
    virtual ~MetadataProvider() = default;

    virtual auto symlink_metadata(const std::string& path) -> Result<LinkMetadata> = 0;
};

} // namespace hearthfs::sandbox
