#pragma once

#include <memory>
#include <string>

#include "hearthfs/sandbox/providers.hpp"
#include "hearthfs/sandbox/root_resolver.hpp"

namespace hearthfs::sandbox {

/// Everything the canonicalizer and symlink guard need from the outside
/// world: where the roots live and how to read link metadata. One context
/// per application (or per test); nothing here is process-global.
class SandboxContext {
public:
    SandboxContext(std::shared_ptr<PathProvider> paths,
                   std::shared_ptr<MetadataProvider> metadata,
                   std::string attachments_dir = "attachments")
        : resolver_(std::move(paths), std::move(attachments_dir))
        , metadata_(std::move(metadata)) {}

    SandboxContext(const SandboxContext&) = delete;
    SandboxContext& operator=(const SandboxContext&) = delete;

    [[nodiscard]] auto resolver() -> RootResolver& { return resolver_; }

    /// May be null if the context was built without a metadata provider.
    [[nodiscard]] auto metadata() const -> MetadataProvider* { return metadata_.get(); }

private:
    RootResolver resolver_;
    std::shared_ptr<MetadataProvider> metadata_;
};

} // namespace hearthfs::sandbox
