#pragma once

#include <memory>
#include <string_view>

#include "hearthfs/core/error.hpp"
#include "hearthfs/sandbox/path_canonicalizer.hpp"
#include "hearthfs/sandbox/root_key.hpp"
#include "hearthfs/sandbox/sandbox_context.hpp"

namespace hearthfs::sandbox {

/// The two checks SafeFileOps runs before every filesystem primitive.
/// Abstract so callers and tests can observe or decorate them.
class PathPolicy {
public:
    virtual ~PathPolicy() = default;

    virtual auto canonicalize(std::string_view input, RootKey root)
        -> Result<CanonicalResult> = 0;
    virtual auto reject_symlinks(std::string_view real_path, RootKey root)
        -> VoidResult = 0;
};

/// Default policy: canonicalize_and_verify() and reject_symlinks() over a
/// shared SandboxContext.
class SandboxPathPolicy : public PathPolicy {
public:
    explicit SandboxPathPolicy(std::shared_ptr<SandboxContext> ctx);

    auto canonicalize(std::string_view input, RootKey root)
        -> Result<CanonicalResult> override;
    auto reject_symlinks(std::string_view real_path, RootKey root)
        -> VoidResult override;

    [[nodiscard]] auto context() -> SandboxContext& { return *ctx_; }

private:
    std::shared_ptr<SandboxContext> ctx_;
};

} // namespace hearthfs::sandbox
