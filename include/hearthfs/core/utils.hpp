#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "hearthfs/core/error.hpp"

namespace hearthfs::utils {

/// Strips leading and trailing Unicode whitespace (White_Space property,
/// so NBSP and U+3000 as well as ASCII blanks). Ill-formed bytes are
/// never treated as whitespace.
auto trim(std::string_view s) -> std::string;

/// True if the last code point of `s` is Unicode whitespace.
auto ends_with_whitespace(std::string_view s) -> bool;

auto split(std::string_view s, char delim) -> std::vector<std::string>;
auto join(const std::vector<std::string>& parts, std::string_view sep) -> std::string;
auto replace_all(std::string_view s, char from, char to) -> std::string;

/// ASCII-only case-insensitive comparison.
auto iequals(std::string_view a, std::string_view b) -> bool;

/// Returns true if `s` is well-formed UTF-8 (no overlongs, surrogates or
/// truncated sequences).
auto is_valid_utf8(std::string_view s) -> bool;

/// Unicode canonical composition (NFC). Input must be valid UTF-8.
auto normalize_nfc(std::string_view s) -> Result<std::string>;

} // namespace hearthfs::utils
