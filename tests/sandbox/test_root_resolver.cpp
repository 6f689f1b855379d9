#include <catch2/catch_test_macros.hpp>

#include "hearthfs/sandbox/root_resolver.hpp"
#include "sandbox_fakes.hpp"

using namespace hearthfs;
using namespace hearthfs::sandbox;
using hearthfs::testing::FakePathProvider;

TEST_CASE("RootResolver appends a trailing slash", "[sandbox][root_resolver]") {
    auto provider = std::make_shared<FakePathProvider>();
    RootResolver resolver(provider);

    CHECK(resolver.resolve_base(RootKey::AppData).value() == "/app/");
    CHECK(resolver.resolve_base(RootKey::AppConfig).value() == "/cfg/");
    CHECK(resolver.resolve_base(RootKey::AppCache).value() == "/cache/");
    CHECK(resolver.resolve_base(RootKey::AppLogs).value() == "/logs/");
}

TEST_CASE("RootResolver places attachments under app data", "[sandbox][root_resolver]") {
    auto provider = std::make_shared<FakePathProvider>();

    RootResolver resolver(provider);
    CHECK(resolver.resolve_base(RootKey::Attachments).value() == "/app/attachments/");

    RootResolver custom(provider, "media/inbox");
    CHECK(custom.resolve_base(RootKey::Attachments).value() == "/app/media/inbox/");
}

TEST_CASE("RootResolver rejects an invalid attachments directory", "[sandbox][root_resolver]") {
    auto provider = std::make_shared<FakePathProvider>();
    RootResolver resolver(provider, "../escape");

    auto result = resolver.resolve_base(RootKey::Attachments);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == ErrorCode::InvalidConfig);

    // Other roots are unaffected.
    CHECK(resolver.resolve_base(RootKey::AppData).has_value());
}

TEST_CASE("RootResolver normalizes Windows directories", "[sandbox][root_resolver]") {
    auto provider = std::make_shared<FakePathProvider>();
    provider->dirs[SpecialDir::AppData] = "c:\\Users\\Alice\\AppData\\";
    RootResolver resolver(provider);

    CHECK(resolver.resolve_base(RootKey::AppData).value() == "C:/Users/Alice/AppData/");
    CHECK(resolver.resolve_base(RootKey::Attachments).value() == "C:/Users/Alice/AppData/attachments/");
}

TEST_CASE("RootResolver caches successful lookups", "[sandbox][root_resolver]") {
    auto provider = std::make_shared<FakePathProvider>();
    RootResolver resolver(provider);

    REQUIRE(resolver.resolve_base(RootKey::AppData).has_value());
    REQUIRE(resolver.resolve_base(RootKey::AppData).has_value());
    CHECK(provider->calls == 1);

    // A changed provider is not observed until the cache is cleared.
    provider->dirs[SpecialDir::AppData] = "/elsewhere";
    CHECK(resolver.resolve_base(RootKey::AppData).value() == "/app/");

    resolver.clear_cache();
    CHECK(resolver.resolve_base(RootKey::AppData).value() == "/elsewhere/");
    CHECK(provider->calls == 2);
}

TEST_CASE("RootResolver instances do not share caches", "[sandbox][root_resolver]") {
    auto first = std::make_shared<FakePathProvider>();
    auto second = std::make_shared<FakePathProvider>();
    second->dirs[SpecialDir::AppData] = "/other";

    RootResolver a(first);
    RootResolver b(second);
    CHECK(a.resolve_base(RootKey::AppData).value() == "/app/");
    CHECK(b.resolve_base(RootKey::AppData).value() == "/other/");
}

TEST_CASE("RootResolver propagates provider failures without caching", "[sandbox][root_resolver]") {
    auto provider = std::make_shared<FakePathProvider>();
    provider->failure = make_error(ErrorCode::Forbidden, "no app data");
    RootResolver resolver(provider);

    auto result = resolver.resolve_base(RootKey::AppData);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == ErrorCode::Forbidden);

    provider->failure.reset();
    CHECK(resolver.resolve_base(RootKey::AppData).value() == "/app/");
    CHECK(provider->calls == 2);
}

TEST_CASE("RootResolver rejects relative or traversing directories", "[sandbox][root_resolver]") {
    for (std::string_view dir : {"", "relative/dir", "/app/../etc", "C:relative"}) {
        auto provider = std::make_shared<FakePathProvider>();
        provider->dirs[SpecialDir::AppData] = std::string(dir);
        RootResolver resolver(provider);

        auto result = resolver.resolve_base(RootKey::AppData);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == ErrorCode::Invalid);
    }
}

TEST_CASE("RootResolver without a provider reports an internal error", "[sandbox][root_resolver]") {
    RootResolver resolver(nullptr);
    auto result = resolver.resolve_base(RootKey::AppData);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == ErrorCode::InternalError);
}

TEST_CASE("normalize_base_dir keeps an existing trailing slash", "[sandbox][root_resolver]") {
    CHECK(normalize_base_dir("/").value() == "/");
    CHECK(normalize_base_dir("/app/").value() == "/app/");
    CHECK(normalize_base_dir("D:\\data").value() == "D:/data/");
}

TEST_CASE("root keys round-trip through their names", "[sandbox][root_key]") {
    for (auto key : kAllRootKeys) {
        auto parsed = parse_root_key(root_key_to_string(key));
        REQUIRE(parsed.has_value());
        CHECK(*parsed == key);
    }
    CHECK(root_key_to_string(RootKey::Attachments) == "attachments");

    auto unknown = parse_root_key("AppData");
    REQUIRE_FALSE(unknown.has_value());
    CHECK(unknown.error().code() == ErrorCode::Invalid);
}
