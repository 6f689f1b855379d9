#include "hearthfs/sandbox/symlink_guard.hpp"

#include <string>

#include "hearthfs/core/logger.hpp"
#include "hearthfs/core/utils.hpp"

namespace hearthfs::sandbox {

auto reject_symlinks(SandboxContext& ctx,
                     std::string_view real_path,
                     RootKey root) -> VoidResult {
    auto base = ctx.resolver().resolve_base(root);
    if (!base) {
        return std::unexpected(base.error());
    }

    if (!real_path.starts_with(*base)) {
        LOG_WARN("Symlink guard: {} is not under root {}", real_path, root_key_to_string(root));
        return std::unexpected(make_error(ErrorCode::OutsideRoot,
            "Path is outside the allowed root"));
    }

    auto* metadata = ctx.metadata();
    if (metadata == nullptr) {
        return std::unexpected(make_error(ErrorCode::InternalError,
            "No metadata provider configured"));
    }

    auto segments = utils::split(real_path.substr(base->size()), '/');
    for (const auto& segment : segments) {
        if (segment == "..") {
            return std::unexpected(make_error(ErrorCode::DotDotRejected,
                "Parent traversal is not allowed"));
        }
    }

    // base ends with '/', so the first segment appends directly.
    std::string current = base->substr(0, base->size() - 1);
    for (const auto& segment : segments) {
        if (segment.empty() || segment == ".") continue;
        current += '/';
        current += segment;

        auto meta = metadata->symlink_metadata(current);
        if (!meta) {
            if (meta.error().code() == ErrorCode::NotFound) {
                // Nothing below a missing entry can exist either.
                break;
            }
            return std::unexpected(meta.error());
        }
        if (meta->is_symlink) {
            LOG_WARN("Symlink rejected under root {}: {}", root_key_to_string(root), current);
            return std::unexpected(make_error(ErrorCode::Symlink,
                "Symlinks are not allowed", current));
        }
    }

    return {};
}

} // namespace hearthfs::sandbox
