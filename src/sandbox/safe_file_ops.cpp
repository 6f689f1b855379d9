#include "hearthfs/sandbox/safe_file_ops.hpp"

#include "hearthfs/core/logger.hpp"
#include "hearthfs/sandbox/path_canonicalizer.hpp"

namespace hearthfs::sandbox {

SafeFileOps::SafeFileOps(std::shared_ptr<PathPolicy> policy, std::shared_ptr<FileSystem> fs)
    : policy_(std::move(policy))
    , fs_(std::move(fs)) {}

auto SafeFileOps::resolve(std::string_view rel_path, RootKey root)
    -> Result<CanonicalResult> {
    if (is_unc_path(rel_path)) {
        LOG_WARN("UNC path refused for root {}", root_key_to_string(root));
        return std::unexpected(make_error(ErrorCode::UncRejected,
            "UNC paths are not allowed"));
    }
    if (looks_absolute(rel_path)) {
        LOG_WARN("Absolute path refused for root {}", root_key_to_string(root));
        return std::unexpected(make_error(ErrorCode::OutsideRoot,
            "Path outside allowlisted root"));
    }

    auto canonical = policy_->canonicalize(rel_path, root);
    if (!canonical) {
        return canonical;
    }

    auto guard = policy_->reject_symlinks(canonical->real_path, root);
    if (!guard) {
        return std::unexpected(guard.error());
    }
    return canonical;
}

auto SafeFileOps::read_text(std::string rel_path, RootKey root)
    -> awaitable<Result<std::string>> {
    auto canonical = resolve(rel_path, root);
    if (!canonical) {
        co_return make_fail(canonical.error());
    }
    co_return co_await fs_->read_text_file(canonical->real_path);
}

auto SafeFileOps::write_text(std::string rel_path, RootKey root, std::string data)
    -> awaitable<Result<void>> {
    auto canonical = resolve(rel_path, root);
    if (!canonical) {
        co_return make_fail(canonical.error());
    }
    co_return co_await fs_->write_text_file(canonical->real_path, data);
}

auto SafeFileOps::read_dir(std::string rel_path, RootKey root)
    -> awaitable<Result<std::vector<DirEntry>>> {
    auto canonical = resolve(rel_path, root);
    if (!canonical) {
        co_return make_fail(canonical.error());
    }
    co_return co_await fs_->list_directory(canonical->real_path);
}

auto SafeFileOps::mkdir(std::string rel_path, RootKey root, MkdirOptions opts)
    -> awaitable<Result<void>> {
    auto canonical = resolve(rel_path, root);
    if (!canonical) {
        co_return make_fail(canonical.error());
    }
    co_return co_await fs_->create_directory(canonical->real_path, opts.recursive);
}

auto SafeFileOps::remove(std::string rel_path, RootKey root, RemoveOptions opts)
    -> awaitable<Result<void>> {
    auto canonical = resolve(rel_path, root);
    if (!canonical) {
        co_return make_fail(canonical.error());
    }
    co_return co_await fs_->remove(canonical->real_path, opts.recursive);
}

auto SafeFileOps::exists(std::string rel_path, RootKey root)
    -> awaitable<Result<bool>> {
    auto canonical = resolve(rel_path, root);
    if (!canonical) {
        co_return make_fail(canonical.error());
    }

    auto meta = co_await fs_->lstat(canonical->real_path);
    if (!meta) {
        if (meta.error().code() == ErrorCode::NotFound) {
            co_return Result<bool>{false};
        }
        co_return make_fail(meta.error());
    }
    co_return Result<bool>{true};
}

} // namespace hearthfs::sandbox
