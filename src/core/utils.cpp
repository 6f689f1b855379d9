#include "hearthfs/core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <limits>

#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf8.h>

namespace hearthfs::utils {

namespace {

/// Unicode White_Space, plus U+FEFF which is commonly pasted in as a
/// leading byte-order mark.
auto is_space_code_point(UChar32 c) -> bool {
    return c >= 0 && (u_isUWhiteSpace(c) || c == 0xFEFF);
}

} // anonymous namespace

auto trim(std::string_view s) -> std::string {
    if (s.size() > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
        return std::string(s);
    }
    const auto* bytes = reinterpret_cast<const uint8_t*>(s.data());
    const auto length = static_cast<int32_t>(s.size());

    int32_t start = 0;
    while (start < length) {
        int32_t next = start;
        UChar32 c = 0;
        U8_NEXT(bytes, next, length, c);
        if (!is_space_code_point(c)) break;
        start = next;
    }

    int32_t end = length;
    while (end > start) {
        int32_t prev = end;
        UChar32 c = 0;
        U8_PREV(bytes, start, prev, c);
        if (!is_space_code_point(c)) break;
        end = prev;
    }
    return std::string(s.substr(static_cast<size_t>(start), static_cast<size_t>(end - start)));
}

auto ends_with_whitespace(std::string_view s) -> bool {
    if (s.empty() || s.size() > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
        return false;
    }
    const auto* bytes = reinterpret_cast<const uint8_t*>(s.data());
    int32_t end = static_cast<int32_t>(s.size());
    UChar32 c = 0;
    U8_PREV(bytes, 0, end, c);
    return is_space_code_point(c);
}

auto split(std::string_view s, char delim) -> std::vector<std::string> {
    std::vector<std::string> parts;
    size_t pos = 0;
    while (pos < s.size()) {
        auto next = s.find(delim, pos);
        if (next == std::string_view::npos) {
            parts.emplace_back(s.substr(pos));
            break;
        }
        parts.emplace_back(s.substr(pos, next - pos));
        pos = next + 1;
    }
    return parts;
}

auto join(const std::vector<std::string>& parts, std::string_view sep) -> std::string {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += sep;
        result += parts[i];
    }
    return result;
}

auto replace_all(std::string_view s, char from, char to) -> std::string {
    std::string result(s);
    std::ranges::replace(result, from, to);
    return result;
}

auto iequals(std::string_view a, std::string_view b) -> bool {
    return std::ranges::equal(a, b, [](unsigned char x, unsigned char y) {
        return std::tolower(x) == std::tolower(y);
    });
}

auto is_valid_utf8(std::string_view s) -> bool {
    if (s.size() > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
        return false;
    }
    const auto* bytes = reinterpret_cast<const uint8_t*>(s.data());
    const auto length = static_cast<int32_t>(s.size());
    int32_t i = 0;
    while (i < length) {
        UChar32 c = 0;
        U8_NEXT(bytes, i, length, c);
        if (c < 0) return false;
    }
    return true;
}

auto normalize_nfc(std::string_view s) -> Result<std::string> {
    UErrorCode status = U_ZERO_ERROR;
    const auto* nfc = icu::Normalizer2::getNFCInstance(status);
    if (U_FAILURE(status)) {
        return std::unexpected(make_error(ErrorCode::InternalError,
            "NFC normalizer unavailable", u_errorName(status)));
    }

    auto source = icu::UnicodeString::fromUTF8(
        icu::StringPiece(s.data(), static_cast<int32_t>(s.size())));
    auto normalized = nfc->normalize(source, status);
    if (U_FAILURE(status)) {
        return std::unexpected(make_error(ErrorCode::InternalError,
            "NFC normalization failed", u_errorName(status)));
    }

    std::string result;
    normalized.toUTF8String(result);
    return result;
}

} // namespace hearthfs::utils
