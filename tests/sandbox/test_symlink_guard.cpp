#include <catch2/catch_test_macros.hpp>

#include "hearthfs/sandbox/symlink_guard.hpp"
#include "sandbox_fakes.hpp"

using namespace hearthfs;
using namespace hearthfs::sandbox;
using hearthfs::testing::FakeSandbox;

TEST_CASE("reject_symlinks passes a plain existing path", "[sandbox][symlink_guard]") {
    FakeSandbox sb;
    sb.metadata->directories = {"/app/attachments/photos"};
    sb.metadata->files = {"/app/attachments/photos/img.png"};

    auto result = reject_symlinks(*sb.ctx, "/app/attachments/photos/img.png", RootKey::Attachments);
    CHECK(result.has_value());
    CHECK(sb.metadata->queried == std::vector<std::string>{
        "/app/attachments/photos",
        "/app/attachments/photos/img.png",
    });
}

TEST_CASE("reject_symlinks rejects a symlinked ancestor", "[sandbox][symlink_guard]") {
    FakeSandbox sb;
    sb.metadata->symlinks = {"/app/attachments/link"};

    auto result = reject_symlinks(*sb.ctx, "/app/attachments/link/file.txt", RootKey::Attachments);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == ErrorCode::Symlink);
    CHECK(result.error().detail() == "/app/attachments/link");
    // The walk stops at the link.
    CHECK(sb.metadata->queried.size() == 1);
}

TEST_CASE("reject_symlinks rejects a symlinked final component", "[sandbox][symlink_guard]") {
    FakeSandbox sb;
    sb.metadata->directories = {"/app/attachments/docs"};
    sb.metadata->symlinks = {"/app/attachments/docs/evil.txt"};

    auto result = reject_symlinks(*sb.ctx, "/app/attachments/docs/evil.txt", RootKey::Attachments);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == ErrorCode::Symlink);
}

TEST_CASE("reject_symlinks stops at the first missing segment", "[sandbox][symlink_guard]") {
    FakeSandbox sb;
    sb.metadata->directories = {"/app/attachments/x"};
    // Would be rejected if the walk continued past the missing "new" directory.
    sb.metadata->symlinks = {"/app/attachments/x/new/link"};

    auto result = reject_symlinks(*sb.ctx, "/app/attachments/x/new/link", RootKey::Attachments);
    CHECK(result.has_value());
    CHECK(sb.metadata->queried.back() == "/app/attachments/x/new");
}

TEST_CASE("reject_symlinks accepts the base itself", "[sandbox][symlink_guard]") {
    FakeSandbox sb;
    auto result = reject_symlinks(*sb.ctx, "/app/attachments/", RootKey::Attachments);
    CHECK(result.has_value());
    CHECK(sb.metadata->queried.empty());
}

TEST_CASE("reject_symlinks propagates other metadata failures", "[sandbox][symlink_guard]") {
    FakeSandbox sb;
    sb.metadata->errors.emplace("/app/attachments/locked",
        make_error(ErrorCode::Forbidden, "permission denied"));

    auto result = reject_symlinks(*sb.ctx, "/app/attachments/locked/file.txt", RootKey::Attachments);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == ErrorCode::Forbidden);
}

TEST_CASE("reject_symlinks re-verifies the root prefix", "[sandbox][symlink_guard]") {
    FakeSandbox sb;
    auto result = reject_symlinks(*sb.ctx, "/etc/passwd", RootKey::Attachments);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == ErrorCode::OutsideRoot);
    CHECK(sb.metadata->queried.empty());

    // Under app data, but not under attachments.
    auto sibling = reject_symlinks(*sb.ctx, "/app/notes.md", RootKey::Attachments);
    REQUIRE_FALSE(sibling.has_value());
    CHECK(sibling.error().code() == ErrorCode::OutsideRoot);
}

TEST_CASE("reject_symlinks refuses parent segments", "[sandbox][symlink_guard]") {
    FakeSandbox sb;
    auto result = reject_symlinks(*sb.ctx, "/app/attachments/../secret", RootKey::Attachments);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == ErrorCode::DotDotRejected);
    CHECK(sb.metadata->queried.empty());
}

TEST_CASE("reject_symlinks needs a metadata provider", "[sandbox][symlink_guard]") {
    auto paths = std::make_shared<hearthfs::testing::FakePathProvider>();
    SandboxContext ctx(paths, nullptr);

    auto result = reject_symlinks(ctx, "/app/attachments/a.txt", RootKey::Attachments);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == ErrorCode::InternalError);
}
