#pragma once

#include <string_view>

#include "hearthfs/core/error.hpp"

namespace hearthfs::cli {

/// Fixed end-user text for an error code. Never includes paths or other
/// details from the error, so filesystem layout is not leaked.
auto user_message(ErrorCode code) -> std::string_view;

inline auto to_user_message(const Error& error) -> std::string_view {
    return user_message(error.code());
}

} // namespace hearthfs::cli
