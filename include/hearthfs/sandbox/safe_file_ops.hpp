#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>

#include "hearthfs/core/error.hpp"
#include "hearthfs/sandbox/file_system.hpp"
#include "hearthfs/sandbox/path_policy.hpp"
#include "hearthfs/sandbox/root_key.hpp"

namespace hearthfs::sandbox {

using boost::asio::awaitable;

struct MkdirOptions {
    bool recursive = false;
};

struct RemoveOptions {
    bool recursive = false;
};

/// The only way the application touches files.
///
/// Every operation takes a caller-supplied relative path and a root, and
/// runs the same sequence:
///   1. reject absolute (OutsideRoot) and UNC (UncRejected) input outright
///   2. canonicalize against the root
///   3. walk the result for symlinks
///   4. call the FileSystem primitive with the canonical path
/// A failure in 1-3 returns immediately without any filesystem call.
/// Primitive errors are returned unchanged, except that exists() reports
/// NotFound as false.
class SafeFileOps {
public:
    SafeFileOps(std::shared_ptr<PathPolicy> policy, std::shared_ptr<FileSystem> fs);

    auto read_text(std::string rel_path, RootKey root)
        -> awaitable<Result<std::string>>;

    auto write_text(std::string rel_path, RootKey root, std::string data)
        -> awaitable<Result<void>>;

    auto read_dir(std::string rel_path, RootKey root)
        -> awaitable<Result<std::vector<DirEntry>>>;

    auto mkdir(std::string rel_path, RootKey root, MkdirOptions opts = {})
        -> awaitable<Result<void>>;

    auto remove(std::string rel_path, RootKey root, RemoveOptions opts = {})
        -> awaitable<Result<void>>;

    auto exists(std::string rel_path, RootKey root)
        -> awaitable<Result<bool>>;

    /// Runs steps 1-3 only and returns the canonical result. For operator
    /// tooling that must report where a path would land.
    [[nodiscard]] auto resolve(std::string_view rel_path, RootKey root)
        -> Result<CanonicalResult>;

private:
    std::shared_ptr<PathPolicy> policy_;
    std::shared_ptr<FileSystem> fs_;
};

} // namespace hearthfs::sandbox
