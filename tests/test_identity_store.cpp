#include <catch2/catch.hpp>
#include "identity/sqlite_identity_store.hpp"
#include <sqlite3.h>
#include <cstdio>
#include <unistd.h>

using namespace rconbridge;

static std::string identity_test_path() {
    return "/tmp/rconbridge_test_identity_" + std::to_string(getpid()) + ".db";
}

struct IdentityDbGuard {
    std::string path = identity_test_path();
    IdentityDbGuard() { cleanup(); }
    ~IdentityDbGuard() { cleanup(); }
    void cleanup() const {
        std::remove(path.c_str());
        std::remove((path + "-wal").c_str());
        std::remove((path + "-shm").c_str());
    }
};

TEST_CASE("SqliteIdentityStore: empty store resolves nothing", "[identity]") {
    IdentityDbGuard g;
    SqliteIdentityStore store(g.path);
    REQUIRE(store.backend_name() == "sqlite");
    REQUIRE(store.count() == 0);
    REQUIRE_FALSE(store.forward("twitch", "U1").has_value());
    REQUIRE(store.reverse("factorio", "Steve").empty());
    REQUIRE_FALSE(store.resolve("twitch", "U1", "factorio").has_value());
}

TEST_CASE("SqliteIdentityStore: forward lookup", "[identity]") {
    IdentityDbGuard g;
    SqliteIdentityStore store(g.path);
    store.upsert({"twitch", "U1", "factorio", "Steve"});

    auto link = store.forward("twitch", "U1");
    REQUIRE(link.has_value());
    REQUIRE(link->target_platform == "factorio");
    REQUIRE(link->target_user_id == "Steve");

    auto id = store.resolve("twitch", "U1", "factorio");
    REQUIRE(id.has_value());
    REQUIRE(id->platform == "factorio");
    REQUIRE(id->user_id == "Steve");
}

TEST_CASE("SqliteIdentityStore: upsert replaces the existing link", "[identity]") {
    IdentityDbGuard g;
    SqliteIdentityStore store(g.path);
    store.upsert({"twitch", "U1", "factorio", "Steve"});
    store.upsert({"twitch", "U1", "factorio", "Alex"});

    REQUIRE(store.count() == 1);
    REQUIRE(store.resolve("twitch", "U1", "factorio")->user_id == "Alex");
}

TEST_CASE("SqliteIdentityStore: reverse lookup resolves a unique match", "[identity]") {
    IdentityDbGuard g;
    SqliteIdentityStore store(g.path);
    store.upsert({"twitch", "U1", "factorio", "Steve"});

    // Steve has no forward row; the twitch row pointing at him is used
    auto id = store.resolve("factorio", "Steve", "twitch");
    REQUIRE(id.has_value());
    REQUIRE(id->platform == "twitch");
    REQUIRE(id->user_id == "U1");
}

TEST_CASE("SqliteIdentityStore: ambiguous reverse lookup resolves nothing", "[identity]") {
    IdentityDbGuard g;
    SqliteIdentityStore store(g.path);
    store.upsert({"twitch", "U1", "factorio", "Steve"});
    store.upsert({"twitch", "U2", "factorio", "Steve"});

    REQUIRE(store.reverse("factorio", "Steve").size() == 2);
    REQUIRE_FALSE(store.resolve("factorio", "Steve", "twitch").has_value());
}

TEST_CASE("SqliteIdentityStore: reverse rows from other platforms are ignored", "[identity]") {
    IdentityDbGuard g;
    SqliteIdentityStore store(g.path);
    store.upsert({"twitch", "U1", "factorio", "Steve"});
    store.upsert({"youtube", "Y9", "factorio", "Steve"});

    auto id = store.resolve("factorio", "Steve", "twitch");
    REQUIRE(id.has_value());
    REQUIRE(id->user_id == "U1");
}

TEST_CASE("SqliteIdentityStore: forward row for another platform falls back to reverse", "[identity]") {
    IdentityDbGuard g;
    SqliteIdentityStore store(g.path);
    store.upsert({"factorio", "Steve", "discord", "D7"});
    store.upsert({"twitch", "U1", "factorio", "Steve"});

    REQUIRE(store.resolve("factorio", "Steve", "twitch")->user_id == "U1");
    REQUIRE(store.resolve("factorio", "Steve", "discord")->user_id == "D7");
}

TEST_CASE("SqliteIdentityStore: empty user id never resolves", "[identity]") {
    IdentityDbGuard g;
    SqliteIdentityStore store(g.path);
    store.upsert({"twitch", "", "factorio", "Ghost"});
    REQUIRE_FALSE(store.resolve("twitch", "", "factorio").has_value());
}

TEST_CASE("SqliteIdentityStore: links persist across reopen", "[identity]") {
    IdentityDbGuard g;
    {
        SqliteIdentityStore store(g.path);
        store.upsert({"twitch", "U1", "factorio", "Steve"});
    }
    SqliteIdentityStore reopened(g.path);
    REQUIRE(reopened.count() == 1);
    REQUIRE(reopened.resolve("twitch", "U1", "factorio")->user_id == "Steve");
}

TEST_CASE("SqliteIdentityStore: uses a table created by the linking flow", "[identity]") {
    IdentityDbGuard g;
    {
        sqlite3* db = nullptr;
        REQUIRE(sqlite3_open(g.path.c_str(), &db) == SQLITE_OK);
        const char* sql =
            "CREATE TABLE user_link ("
            " source_platform TEXT NOT NULL, source_user_id TEXT NOT NULL,"
            " target_platform TEXT NOT NULL, target_user_id TEXT NOT NULL,"
            " PRIMARY KEY(source_platform, source_user_id));"
            "INSERT INTO user_link VALUES ('twitch', 'U5', 'factorio', 'Ada');";
        REQUIRE(sqlite3_exec(db, sql, nullptr, nullptr, nullptr) == SQLITE_OK);
        sqlite3_close(db);
    }

    SqliteIdentityStore store(g.path);
    REQUIRE(store.resolve("twitch", "U5", "factorio")->user_id == "Ada");
}
