#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "hearthfs/core/error.hpp"

namespace hearthfs::sandbox {

/// Maximum UTF-8 byte length of a single path component.
inline constexpr std::size_t kMaxComponentBytes = 255;

/// Maximum cumulative UTF-8 byte length of all components of a path.
inline constexpr std::size_t kMaxPathBytes = 32 * 1024;

/// Returns true if `segment` is a reserved device name (CON, PRN, AUX, NUL,
/// COM1-COM9, LPT1-LPT9), compared case-insensitively and without regard
/// to extension ("NUL.txt" is not reserved).
auto is_reserved_device_name(std::string_view segment) -> bool;

/// Validates a caller-supplied relative path and returns its normalized
/// form: NFC, forward slashes, no leading slash, no empty / "." segments,
/// each component trimmed of leading whitespace.
///
/// Rejections, in evaluation order:
///   - Empty:           blank input
///   - Invalid:         ill-formed UTF-8
///   - PathOutOfVault:  drive prefix ("C:...") or a ".." component
///   - FilenameInvalid: forbidden or control character, trailing
///                      whitespace, reserved device name, nothing left
///   - NameTooLong:     component > 255 bytes or total > 32 KiB
///
/// Pure and deterministic; sanitize(sanitize(p)) == sanitize(p).
[[nodiscard]] auto sanitize_relative_path(std::string_view raw) -> Result<std::string>;

} // namespace hearthfs::sandbox
