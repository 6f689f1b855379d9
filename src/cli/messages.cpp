#include "hearthfs/cli/messages.hpp"

namespace hearthfs::cli {

auto user_message(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::Empty:
            return "A file name is required.";
        case ErrorCode::PathOutOfVault:
        case ErrorCode::DotDotRejected:
        case ErrorCode::UncRejected:
        case ErrorCode::CrossVolume:
        case ErrorCode::OutsideRoot:
        case ErrorCode::Symlink:
            return "That location isn't allowed.";
        case ErrorCode::FilenameInvalid:
            return "That file name isn't allowed.";
        case ErrorCode::NameTooLong:
            return "That file name is too long.";
        case ErrorCode::Invalid:
            return "That path isn't valid.";
        case ErrorCode::NotFound:
            return "The file or folder could not be found.";
        case ErrorCode::AlreadyExists:
            return "A file or folder already exists there.";
        case ErrorCode::Forbidden:
            return "Permission denied.";
        case ErrorCode::IoError:
            return "The file could not be read or written.";
        case ErrorCode::InvalidConfig:
        case ErrorCode::InvalidArgument:
            return "The request is not valid.";
        case ErrorCode::InternalError:
        case ErrorCode::Unknown:
            return "Something went wrong.";
    }
    return "Something went wrong.";
}

} // namespace hearthfs::cli
