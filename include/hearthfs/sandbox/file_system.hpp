#pragma once

#include <string>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>

#include "hearthfs/core/error.hpp"
#include "hearthfs/sandbox/providers.hpp"

namespace hearthfs::sandbox {

using boost::asio::awaitable;

struct DirEntry {
    std::string name;
    bool is_directory = false;
    bool is_file = false;
    bool is_symlink = false;
};

/// Raw platform filesystem primitives. Implementations perform no path
/// validation of their own; callers must only hand them canonical paths
/// produced by the sandbox (see SafeFileOps).
class FileSystem {
public:
    virtual ~FileSystem() = default;

    virtual auto read_text_file(const std::string& path) -> awaitable<Result<std::string>> = 0;
    virtual auto write_text_file(const std::string& path, const std::string& data)
        -> awaitable<Result<void>> = 0;
    virtual auto list_directory(const std::string& path)
        -> awaitable<Result<std::vector<DirEntry>>> = 0;
    virtual auto create_directory(const std::string& path, bool recursive)
        -> awaitable<Result<void>> = 0;
    virtual auto remove(const std::string& path, bool recursive) -> awaitable<Result<void>> = 0;
    virtual auto lstat(const std::string& path) -> awaitable<Result<LinkMetadata>> = 0;
};

} // namespace hearthfs::sandbox
