#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "fixtures/mock_ledger.hpp"

#include <resolvit/cache/sqlite_cache.hpp>
#include <resolvit/common/log.hpp>

#include <thread>

using namespace resolvit;
using namespace resolvit::cache;
using namespace resolvit::testing;

TEST_SUITE("SqliteCache") {

    TEST_CASE("Open and basic operations") {
        SqliteCache cache;
        REQUIRE(cache.open(":memory:"));
        CHECK(cache.isOpen());

        CHECK_FALSE(cache.get("k").has_value());
        cache.set("k", "sovrin");
        CHECK(cache.get("k") == std::optional<std::string>("sovrin"));

        cache.set("k", "bcovrin");
        CHECK(cache.get("k") == std::optional<std::string>("bcovrin"));
        CHECK(cache.entryCount() == 1);

        cache.clear("k");
        CHECK_FALSE(cache.get("k").has_value());
    }

    TEST_CASE("Expired rows are invisible and purgeable") {
        SqliteCache cache;
        REQUIRE(cache.open(":memory:"));
        cache.set("gone", "x", std::chrono::seconds(0));
        cache.set("kept", "y", std::chrono::seconds(60));
        cache.set("forever", "z");

        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        CHECK_FALSE(cache.get("gone").has_value());
        CHECK(cache.get("kept").has_value());
        CHECK(cache.entryCount() == 3);

        CHECK(cache.purgeExpired() == 1);
        CHECK(cache.entryCount() == 2);
        CHECK(cache.get("forever") == std::optional<std::string>("z"));
    }

    TEST_CASE("Entries survive reopening the database") {
        TempDir dir;
        auto path = (dir.path / "cache.db").string();
        {
            SqliteCache cache;
            REQUIRE(cache.open(path));
            cache.set("did_ledger_id_resolver::abc", "sovrin", std::chrono::seconds(600));
        }
        SqliteCache reopened;
        REQUIRE(reopened.open(path));
        CHECK(reopened.get("did_ledger_id_resolver::abc") == std::optional<std::string>("sovrin"));
    }

    TEST_CASE("Flush removes everything") {
        SqliteCache cache;
        REQUIRE(cache.open(":memory:"));
        cache.set("a", "1");
        cache.set("b", "2");
        cache.flush();
        CHECK(cache.entryCount() == 0);
    }

    TEST_CASE("Closed cache is inert") {
        SqliteCache cache;
        CHECK_FALSE(cache.isOpen());
        cache.set("a", "1");
        CHECK_FALSE(cache.get("a").has_value());
        CHECK(cache.purgeExpired() == 0);
    }

    TEST_CASE("Unopenable path fails") {
        log::setLevel(log::Level::Off);
        TempDir dir;
        SqliteCache cache;
        CHECK_FALSE(cache.open((dir.path / "missing" / "dir" / "cache.db").string()));
        CHECK_FALSE(cache.isOpen());
    }
}
