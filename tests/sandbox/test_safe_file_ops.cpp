#include <catch2/catch_test_macros.hpp>

#include <functional>

#include "hearthfs/sandbox/safe_file_ops.hpp"
#include "sandbox_fakes.hpp"

using namespace hearthfs;
using namespace hearthfs::sandbox;
using hearthfs::testing::CountingPolicy;
using hearthfs::testing::FakeSandbox;
using hearthfs::testing::RecordingFileSystem;
using hearthfs::testing::run_sync;

namespace {

struct OpsFixture {
    FakeSandbox sandbox;
    std::shared_ptr<CountingPolicy> policy = std::make_shared<CountingPolicy>(sandbox.ctx);
    std::shared_ptr<RecordingFileSystem> fs = std::make_shared<RecordingFileSystem>();
    SafeFileOps ops{policy, fs};
};

/// Runs one SafeFileOps entry point and returns its error code, or
/// nothing on success.
using OpRunner = std::function<std::optional<ErrorCode>(SafeFileOps&, const std::string&)>;

template <typename T>
auto code_of(const Result<T>& result) -> std::optional<ErrorCode> {
    if (result) return std::nullopt;
    return result.error().code();
}

auto all_ops() -> std::vector<std::pair<std::string, OpRunner>> {
    return {
        {"read_text", [](SafeFileOps& ops, const std::string& p) {
            return code_of(run_sync(ops.read_text(p, RootKey::Attachments)));
        }},
        {"write_text", [](SafeFileOps& ops, const std::string& p) {
            return code_of(run_sync(ops.write_text(p, RootKey::Attachments, "data")));
        }},
        {"read_dir", [](SafeFileOps& ops, const std::string& p) {
            return code_of(run_sync(ops.read_dir(p, RootKey::Attachments)));
        }},
        {"mkdir", [](SafeFileOps& ops, const std::string& p) {
            return code_of(run_sync(ops.mkdir(p, RootKey::Attachments)));
        }},
        {"remove", [](SafeFileOps& ops, const std::string& p) {
            return code_of(run_sync(ops.remove(p, RootKey::Attachments)));
        }},
        {"exists", [](SafeFileOps& ops, const std::string& p) {
            return code_of(run_sync(ops.exists(p, RootKey::Attachments)));
        }},
    };
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Happy paths
// ---------------------------------------------------------------------------

TEST_CASE("SafeFileOps reads through the canonical path", "[sandbox][safe_file_ops]") {
    OpsFixture f;
    auto result = run_sync(f.ops.read_text("notes/today.md", RootKey::Attachments));
    REQUIRE(result.has_value());
    CHECK(*result == "hello");
    CHECK(f.fs->calls == std::vector<std::string>{"read /app/attachments/notes/today.md"});
}

TEST_CASE("SafeFileOps writes through the canonical path", "[sandbox][safe_file_ops]") {
    OpsFixture f;
    auto result = run_sync(f.ops.write_text("x/test.txt", RootKey::Attachments, "payload"));
    REQUIRE(result.has_value());
    CHECK(f.fs->calls == std::vector<std::string>{"write /app/attachments/x/test.txt"});
    CHECK(f.fs->written == std::vector<std::string>{"payload"});
}

TEST_CASE("SafeFileOps lists the root for an empty path", "[sandbox][safe_file_ops]") {
    OpsFixture f;
    auto result = run_sync(f.ops.read_dir("", RootKey::Attachments));
    REQUIRE(result.has_value());
    CHECK(result->size() == 2);
    CHECK(f.fs->calls == std::vector<std::string>{"list /app/attachments/"});
}

TEST_CASE("SafeFileOps passes the recursive flags through", "[sandbox][safe_file_ops]") {
    OpsFixture f;
    REQUIRE(run_sync(f.ops.mkdir("a/b", RootKey::Attachments, MkdirOptions{.recursive = true})));
    REQUIRE(run_sync(f.ops.mkdir("c", RootKey::Attachments)));
    REQUIRE(run_sync(f.ops.remove("a", RootKey::Attachments, RemoveOptions{.recursive = true})));
    REQUIRE(run_sync(f.ops.remove("c", RootKey::Attachments)));
    CHECK(f.fs->calls == std::vector<std::string>{
        "mkdir /app/attachments/a/b recursive",
        "mkdir /app/attachments/c",
        "remove /app/attachments/a recursive",
        "remove /app/attachments/c",
    });
}

TEST_CASE("SafeFileOps uses the requested root", "[sandbox][safe_file_ops]") {
    OpsFixture f;
    REQUIRE(run_sync(f.ops.read_text("settings.json", RootKey::AppConfig)));
    REQUIRE(run_sync(f.ops.read_text("journal.db", RootKey::AppData)));
    CHECK(f.fs->calls == std::vector<std::string>{
        "read /cfg/settings.json",
        "read /app/journal.db",
    });
}

TEST_CASE("SafeFileOps canonicalizes and guards exactly once per call", "[sandbox][safe_file_ops]") {
    for (auto& [name, run] : all_ops()) {
        INFO(name);
        OpsFixture f;
        CHECK_FALSE(run(f.ops, "dir/file.txt").has_value());
        CHECK(f.policy->canonicalize_calls == 1);
        CHECK(f.policy->guard_calls == 1);
        CHECK(f.fs->calls.size() == 1);
    }
}

// ---------------------------------------------------------------------------
// exists
// ---------------------------------------------------------------------------

TEST_CASE("SafeFileOps exists reports true for an existing entry", "[sandbox][safe_file_ops]") {
    OpsFixture f;
    auto result = run_sync(f.ops.exists("a.txt", RootKey::Attachments));
    REQUIRE(result.has_value());
    CHECK(*result);
    CHECK(f.fs->calls == std::vector<std::string>{"lstat /app/attachments/a.txt"});
}

TEST_CASE("SafeFileOps exists maps NotFound to false", "[sandbox][safe_file_ops]") {
    OpsFixture f;
    f.fs->lstat_error = make_error(ErrorCode::NotFound, "no such file");
    auto result = run_sync(f.ops.exists("missing.txt", RootKey::Attachments));
    REQUIRE(result.has_value());
    CHECK_FALSE(*result);
}

TEST_CASE("SafeFileOps exists propagates other failures", "[sandbox][safe_file_ops]") {
    OpsFixture f;
    f.fs->lstat_error = make_error(ErrorCode::Forbidden, "permission denied");
    auto result = run_sync(f.ops.exists("locked.txt", RootKey::Attachments));
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == ErrorCode::Forbidden);
}

TEST_CASE("SafeFileOps returns primitive errors unchanged", "[sandbox][safe_file_ops]") {
    OpsFixture f;
    f.fs->primitive_error = make_error(ErrorCode::NotFound, "no such file", "detail");
    auto result = run_sync(f.ops.read_text("gone.txt", RootKey::Attachments));
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == ErrorCode::NotFound);
    CHECK(result.error().detail() == "detail");
}

// ---------------------------------------------------------------------------
// Rejections perform no filesystem calls
// ---------------------------------------------------------------------------

TEST_CASE("SafeFileOps fast-rejects absolute and UNC input", "[sandbox][safe_file_ops]") {
    for (auto& [name, run] : all_ops()) {
        INFO(name);
        OpsFixture f;
        CHECK(run(f.ops, "/etc/passwd") == ErrorCode::OutsideRoot);
        CHECK(run(f.ops, "/app/attachments/img.png") == ErrorCode::OutsideRoot);
        CHECK(run(f.ops, "C:\\Windows\\win.ini") == ErrorCode::OutsideRoot);
        CHECK(run(f.ops, "\\\\server\\share\\x") == ErrorCode::UncRejected);
        CHECK(run(f.ops, "//server/share/x") == ErrorCode::UncRejected);
        CHECK(f.policy->canonicalize_calls == 0);
        CHECK(f.fs->calls.empty());
    }
}

TEST_CASE("SafeFileOps stops when canonicalization fails", "[sandbox][safe_file_ops]") {
    for (auto& [name, run] : all_ops()) {
        INFO(name);
        OpsFixture f;
        CHECK(run(f.ops, "../escape.txt") == ErrorCode::DotDotRejected);
        CHECK(f.policy->canonicalize_calls == 1);
        CHECK(f.policy->guard_calls == 0);
        CHECK(f.fs->calls.empty());
    }
}

TEST_CASE("SafeFileOps stops when the symlink guard fails", "[sandbox][safe_file_ops]") {
    for (auto& [name, run] : all_ops()) {
        INFO(name);
        OpsFixture f;
        f.sandbox.metadata->symlinks = {"/app/attachments/link"};
        CHECK(run(f.ops, "link/file.txt") == ErrorCode::Symlink);
        CHECK(f.policy->canonicalize_calls == 1);
        CHECK(f.policy->guard_calls == 1);
        CHECK(f.fs->calls.empty());
    }
}

TEST_CASE("SafeFileOps stops when the root cannot be resolved", "[sandbox][safe_file_ops]") {
    OpsFixture f;
    f.sandbox.paths->failure = make_error(ErrorCode::IoError, "no home directory");
    auto result = run_sync(f.ops.write_text("a.txt", RootKey::Attachments, "x"));
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == ErrorCode::IoError);
    CHECK(f.fs->calls.empty());
}

// ---------------------------------------------------------------------------
// resolve
// ---------------------------------------------------------------------------

TEST_CASE("SafeFileOps resolve reports the canonical location", "[sandbox][safe_file_ops]") {
    OpsFixture f;
    auto result = f.ops.resolve("sub\\nested\\file.txt", RootKey::Attachments);
    REQUIRE(result.has_value());
    CHECK(result->real_path == "/app/attachments/sub/nested/file.txt");
    CHECK(f.fs->calls.empty());

    auto rejected = f.ops.resolve("/etc/passwd", RootKey::Attachments);
    REQUIRE_FALSE(rejected.has_value());
    CHECK(rejected.error().code() == ErrorCode::OutsideRoot);
}
