#include "hearthfs/sandbox/path_sanitizer.hpp"

#include <array>
#include <cctype>
#include <vector>

#include "hearthfs/core/logger.hpp"
#include "hearthfs/core/utils.hpp"

namespace hearthfs::sandbox {

namespace {

constexpr std::array<std::string_view, 22> kReservedNames = {
    "CON", "PRN", "AUX", "NUL",
    "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7", "COM8", "COM9",
    "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9",
};

constexpr std::string_view kForbiddenChars = "<>:\"\\|?*";

auto has_forbidden_char(std::string_view segment) -> bool {
    for (unsigned char c : segment) {
        if (c < 0x20) return true;
        if (kForbiddenChars.find(static_cast<char>(c)) != std::string_view::npos) return true;
    }
    return false;
}

auto has_drive_prefix(std::string_view path) -> bool {
    return path.size() >= 2 &&
        std::isalpha(static_cast<unsigned char>(path[0])) != 0 &&
        path[1] == ':';
}

auto reject(ErrorCode code, std::string message) -> Result<std::string> {
    LOG_DEBUG("Path rejected ({}): {}", error_code_to_string(code), message);
    return std::unexpected(make_error(code, std::move(message)));
}

/// Validates one raw, non-empty, non-"." segment; returns it trimmed.
auto validate_component(std::string_view raw) -> Result<std::string> {
    auto segment = utils::trim(raw);

    if (segment == ".." || segment == ".") {
        return reject(ErrorCode::PathOutOfVault,
            "Paths may not include traversal segments");
    }
    if (has_forbidden_char(segment)) {
        return reject(ErrorCode::FilenameInvalid,
            "File names contain unsupported characters");
    }
    if (utils::ends_with_whitespace(raw)) {
        return reject(ErrorCode::FilenameInvalid,
            "File names may not end with spaces");
    }
    if (is_reserved_device_name(segment)) {
        return reject(ErrorCode::FilenameInvalid,
            "File names may not use reserved device names");
    }
    if (segment.size() > kMaxComponentBytes) {
        return reject(ErrorCode::NameTooLong, "File name is too long");
    }
    return segment;
}

} // anonymous namespace

auto is_reserved_device_name(std::string_view segment) -> bool {
    for (auto name : kReservedNames) {
        if (utils::iequals(segment, name)) return true;
    }
    return false;
}

auto sanitize_relative_path(std::string_view raw) -> Result<std::string> {
    auto trimmed = utils::trim(raw);
    if (trimmed.empty()) {
        return reject(ErrorCode::Empty, "Path is required");
    }
    if (!utils::is_valid_utf8(trimmed)) {
        return reject(ErrorCode::Invalid, "Path is not valid UTF-8");
    }

    auto normalized = utils::normalize_nfc(trimmed);
    if (!normalized) {
        return std::unexpected(normalized.error());
    }

    auto candidate = utils::replace_all(*normalized, '\\', '/');
    auto first = candidate.find_first_not_of('/');
    candidate.erase(0, first == std::string::npos ? candidate.size() : first);

    if (has_drive_prefix(candidate)) {
        return reject(ErrorCode::PathOutOfVault, "Absolute drives are not allowed");
    }

    std::vector<std::string> accepted;
    size_t total_bytes = 0;
    for (const auto& segment : utils::split(candidate, '/')) {
        if (segment.empty() || segment == ".") continue;

        auto clean = validate_component(segment);
        if (!clean) {
            return clean;
        }

        total_bytes += clean->size();
        if (total_bytes > kMaxPathBytes) {
            return reject(ErrorCode::NameTooLong, "Path is too long");
        }
        accepted.push_back(std::move(*clean));
    }

    auto result = utils::join(accepted, "/");
    if (result.empty()) {
        return reject(ErrorCode::FilenameInvalid, "Path segments cannot be empty");
    }
    return result;
}

} // namespace hearthfs::sandbox
