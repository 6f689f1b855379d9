#include "hearthfs/sandbox/path_canonicalizer.hpp"

#include <cctype>

#include "hearthfs/core/logger.hpp"
#include "hearthfs/core/utils.hpp"

namespace hearthfs::sandbox {

auto is_unc_path(std::string_view path) -> bool {
    if (path.starts_with("\\\\")) return true;
    auto norm = utils::replace_all(path, '\\', '/');
    return norm.size() > 2 && norm.starts_with("//") && norm[2] != '/';
}

auto looks_absolute(std::string_view path) -> bool {
    if (is_unc_path(path)) return true;
    if (path.starts_with('/') || path.starts_with('\\')) return true;
    return drive_letter(path).has_value();
}

auto drive_letter(std::string_view path) -> std::optional<char> {
    if (path.size() >= 2 && path[1] == ':' &&
        std::isalpha(static_cast<unsigned char>(path[0])) != 0) {
        return static_cast<char>(std::toupper(static_cast<unsigned char>(path[0])));
    }
    return std::nullopt;
}

auto collapse_dot_segments(std::string_view path) -> std::vector<std::string> {
    std::vector<std::string> stack;
    for (auto& segment : utils::split(path, '/')) {
        if (segment.empty() || segment == ".") continue;
        if (segment == "..") {
            if (stack.empty() || stack.back() == "..") {
                stack.push_back(std::move(segment));
            } else {
                stack.pop_back();
            }
            continue;
        }
        stack.push_back(std::move(segment));
    }
    return stack;
}

auto canonicalize_and_verify(SandboxContext& ctx,
                             std::string_view input,
                             RootKey root) -> Result<CanonicalResult> {
    // UNC inputs are refused before they can be joined onto anything.
    if (is_unc_path(input)) {
        LOG_WARN("UNC path rejected for root {}: {}", root_key_to_string(root), input);
        return std::unexpected(make_error(ErrorCode::UncRejected,
            "UNC paths are not allowed"));
    }
    if (input.find('\0') != std::string_view::npos) {
        return std::unexpected(make_error(ErrorCode::Invalid,
            "Path contains a NUL byte"));
    }

    if (!utils::is_valid_utf8(input)) {
        return std::unexpected(make_error(ErrorCode::Invalid,
            "Path is not valid UTF-8"));
    }

    // Same composition as sanitize_relative_path(), so both agree on bytes.
    auto composed = utils::normalize_nfc(input);
    if (!composed) {
        return std::unexpected(composed.error());
    }

    auto norm = utils::replace_all(*composed, '\\', '/');
    auto drive = drive_letter(norm);
    bool absolute = drive.has_value() || norm.starts_with('/');
    auto rest = std::string_view(norm).substr(drive ? 2 : 0);

    auto segments = collapse_dot_segments(rest);
    for (const auto& segment : segments) {
        if (segment == "..") {
            LOG_DEBUG("Parent traversal rejected for root {}: {}", root_key_to_string(root), input);
            return std::unexpected(make_error(ErrorCode::DotDotRejected,
                "Parent traversal is not allowed"));
        }
    }

    auto base = ctx.resolver().resolve_base(root);
    if (!base) {
        return std::unexpected(base.error());
    }

    std::string candidate;
    if (absolute) {
        auto base_drive = drive_letter(*base);
        if (drive && base_drive && *drive != *base_drive) {
            LOG_WARN("Cross-volume path rejected for root {}: {}", root_key_to_string(root), input);
            return std::unexpected(make_error(ErrorCode::CrossVolume,
                "Cross-volume paths are not allowed"));
        }
        candidate = drive ? std::string{*drive, ':', '/'} : std::string("/");
        candidate += utils::join(segments, "/");
    } else {
        candidate = *base + utils::join(segments, "/");
    }

    if (!candidate.starts_with(*base)) {
        LOG_WARN("Path outside root {} rejected: {}", root_key_to_string(root), input);
        return std::unexpected(make_error(ErrorCode::OutsideRoot,
            "Path is outside the allowed root"));
    }

    return CanonicalResult{
        .input = std::string(input),
        .root_key = root,
        .base = std::move(*base),
        .real_path = std::move(candidate),
    };
}

} // namespace hearthfs::sandbox
