#include <catch2/catch_test_macros.hpp>

#include <string>

#include "hearthfs/cli/messages.hpp"

using hearthfs::ErrorCode;

TEST_CASE("user messages never include error details", "[cli][messages]") {
    auto err = hearthfs::make_error(ErrorCode::Symlink,
        "Symlinks are not allowed", "/home/alice/.local/share/hearthfs/attachments/link");
    auto text = std::string(hearthfs::cli::to_user_message(err));

    CHECK(text == "That location isn't allowed.");
    CHECK(text.find('/') == std::string::npos);
    CHECK(text.find("alice") == std::string::npos);
}

TEST_CASE("location rejections share one message", "[cli][messages]") {
    for (auto code : {ErrorCode::PathOutOfVault, ErrorCode::DotDotRejected,
                      ErrorCode::UncRejected, ErrorCode::CrossVolume,
                      ErrorCode::OutsideRoot, ErrorCode::Symlink}) {
        CHECK(hearthfs::cli::user_message(code) == "That location isn't allowed.");
    }
}

TEST_CASE("every code has a non-empty message", "[cli][messages]") {
    for (int i = static_cast<int>(ErrorCode::Unknown);
         i <= static_cast<int>(ErrorCode::Invalid); ++i) {
        auto text = hearthfs::cli::user_message(static_cast<ErrorCode>(i));
        CHECK_FALSE(text.empty());
        CHECK(text.find('/') == std::string_view::npos);
    }
    CHECK(hearthfs::cli::user_message(ErrorCode::FilenameInvalid) == "That file name isn't allowed.");
    CHECK(hearthfs::cli::user_message(ErrorCode::NameTooLong) == "That file name is too long.");
    CHECK(hearthfs::cli::user_message(ErrorCode::Empty) == "A file name is required.");
}
