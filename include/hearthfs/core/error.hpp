#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace hearthfs {

enum class ErrorCode {
    Unknown = 1,
    InvalidConfig,
    InvalidArgument,
    NotFound,
    AlreadyExists,
    Forbidden,
    IoError,
    InternalError,

    // Sandbox path rejections.
    Empty,
    PathOutOfVault,
    DotDotRejected,
    FilenameInvalid,
    NameTooLong,
    UncRejected,
    CrossVolume,
    OutsideRoot,
    Symlink,
    Invalid,
};

class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, std::string detail)
        : code_(code), message_(std::move(message)), detail_(std::move(detail)) {}

    [[nodiscard]] auto code() const noexcept -> ErrorCode { return code_; }
    [[nodiscard]] auto message() const noexcept -> std::string_view { return message_; }
    [[nodiscard]] auto detail() const noexcept -> std::string_view { return detail_; }

    [[nodiscard]] auto what() const -> std::string {
        if (detail_.empty()) return message_;
        return message_ + ": " + detail_;
    }

private:
    ErrorCode code_;
    std::string message_;
    std::string detail_;
};

template <typename T>
using Result = std::expected<T, Error>;

using VoidResult = std::expected<void, Error>;

inline auto make_error(ErrorCode code, std::string message) -> Error {
    return Error(code, std::move(message));
}

inline auto make_error(ErrorCode code, std::string message, std::string detail) -> Error {
    return Error(code, std::move(message), std::move(detail));
}

/// Convert ErrorCode to its machine-readable name (e.g. "OUTSIDE_ROOT").
inline auto error_code_to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::Unknown: return "UNKNOWN";
        case ErrorCode::InvalidConfig: return "INVALID_CONFIG";
        case ErrorCode::InvalidArgument: return "INVALID_ARGUMENT";
        case ErrorCode::NotFound: return "NOT_FOUND";
        case ErrorCode::AlreadyExists: return "ALREADY_EXISTS";
        case ErrorCode::Forbidden: return "FORBIDDEN";
        case ErrorCode::IoError: return "IO_ERROR";
        case ErrorCode::InternalError: return "INTERNAL_ERROR";
        case ErrorCode::Empty: return "EMPTY";
        case ErrorCode::PathOutOfVault: return "PATH_OUT_OF_VAULT";
        case ErrorCode::DotDotRejected: return "DOT_DOT_REJECTED";
        case ErrorCode::FilenameInvalid: return "FILENAME_INVALID";
        case ErrorCode::NameTooLong: return "NAME_TOO_LONG";
        case ErrorCode::UncRejected: return "UNC_REJECTED";
        case ErrorCode::CrossVolume: return "CROSS_VOLUME";
        case ErrorCode::OutsideRoot: return "OUTSIDE_ROOT";
        case ErrorCode::Symlink: return "SYMLINK";
        case ErrorCode::Invalid: return "INVALID";
        default: return "UNKNOWN";
    }
}

/// True for the closed set of codes raised by the path sandbox
/// (sanitizer, canonicalizer, symlink guard). Platform I/O codes are not
/// path errors.
inline auto is_path_error(ErrorCode code) noexcept -> bool {
    switch (code) {
        case ErrorCode::Empty:
        case ErrorCode::PathOutOfVault:
        case ErrorCode::DotDotRejected:
        case ErrorCode::FilenameInvalid:
        case ErrorCode::NameTooLong:
        case ErrorCode::UncRejected:
        case ErrorCode::CrossVolume:
        case ErrorCode::OutsideRoot:
        case ErrorCode::Symlink:
        case ErrorCode::Invalid:
            return true;
        default:
            return false;
    }
}

// GCC 14 ICE workaround for co_return std::unexpected(...) in coroutines.
// The wrapper defers the std::unexpected -> std::expected conversion to a
// user-defined conversion operator outside the coroutine frame.
// See: https://gcc.gnu.org/bugzilla/show_bug.cgi?id=112341
struct Fail {
    Error error;

    explicit Fail(Error e) : error(std::move(e)) {}

    template <typename T>
    operator Result<T>() && { return std::unexpected(std::move(error)); }
};

/// Use co_return make_fail(err) instead of co_return std::unexpected(err).
inline auto make_fail(Error e) -> Fail { return Fail(std::move(e)); }

/// Use co_return ok_result() instead of co_return Result<void>{}.
inline auto ok_result() -> Result<void> { return {}; }

} // namespace hearthfs
