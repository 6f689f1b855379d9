#include "hearthfs/sandbox/path_policy.hpp"

#include "hearthfs/sandbox/symlink_guard.hpp"

namespace hearthfs::sandbox {

SandboxPathPolicy::SandboxPathPolicy(std::shared_ptr<SandboxContext> ctx)
    : ctx_(std::move(ctx)) {}

auto SandboxPathPolicy::canonicalize(std::string_view input, RootKey root)
    -> Result<CanonicalResult> {
    return canonicalize_and_verify(*ctx_, input, root);
}

auto SandboxPathPolicy::reject_symlinks(std::string_view real_path, RootKey root)
    -> VoidResult {
    return sandbox::reject_symlinks(*ctx_, real_path, root);
}

} // namespace hearthfs::sandbox
