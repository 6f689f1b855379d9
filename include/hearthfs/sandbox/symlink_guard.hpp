#pragma once

#include <string_view>

#include "hearthfs/core/error.hpp"
#include "hearthfs/sandbox/root_key.hpp"
#include "hearthfs/sandbox/sandbox_context.hpp"

namespace hearthfs::sandbox {

/// Walks `real_path` from the base of `root` one segment at a time and
/// rejects it if any existing segment is a symbolic link.
///
/// The base prefix is re-verified first (OutsideRoot), so the guard is
/// safe to call on its own. The walk stops successfully at the first
/// segment that does not exist yet, which keeps create flows working.
/// A symlink yields ErrorCode::Symlink with the offending path as detail.
/// Metadata failures other than NotFound propagate unchanged.
///
/// The check and the caller's subsequent I/O are not atomic; a racing
/// process could swap in a link between the two.
[[nodiscard]] auto reject_symlinks(SandboxContext& ctx,
                                   std::string_view real_path,
                                   RootKey root) -> VoidResult;

} // namespace hearthfs::sandbox
