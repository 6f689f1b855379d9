#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "hearthfs/core/error.hpp"
#include "hearthfs/sandbox/root_key.hpp"
#include "hearthfs/sandbox/sandbox_context.hpp"

namespace hearthfs::sandbox {

/// Output of canonicalize_and_verify(). `real_path` always starts with
/// `base`. Valid for a single operation only; never cache it.
struct CanonicalResult {
    std::string input;
    RootKey root_key;
    std::string base;
    std::string real_path;
};

/// True for "\\..." and for "//host..." (after converting backslashes).
/// A bare "//" or "///x" is not UNC.
auto is_unc_path(std::string_view path) -> bool;

/// True if `path` is UNC-like, starts with a separator, or starts with a
/// drive letter ("C:").
auto looks_absolute(std::string_view path) -> bool;

/// Upper-cased drive letter of "X:..." paths.
auto drive_letter(std::string_view path) -> std::optional<char>;

/// Textual "."/".." collapse over '/'-separated segments. Empty and "."
/// segments are dropped; ".." pops the previous segment unless the stack
/// is empty or already ends in "..", in which case it is kept.
auto collapse_dot_segments(std::string_view path) -> std::vector<std::string>;

/// Resolves `input` against the base of `root` without touching the
/// filesystem and verifies the result stays under that base. The input
/// is NFC-composed first, as sanitize_relative_path() does.
///
/// Errors: UncRejected, Invalid (embedded NUL or ill-formed UTF-8),
/// DotDotRejected, CrossVolume, OutsideRoot, or whatever the root
/// resolver reports.
/// Filename legality is not checked here; see sanitize_relative_path().
[[nodiscard]] auto canonicalize_and_verify(SandboxContext& ctx,
                                           std::string_view input,
                                           RootKey root) -> Result<CanonicalResult>;

} // namespace hearthfs::sandbox
