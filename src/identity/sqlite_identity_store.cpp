#include "sqlite_identity_store.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <stdexcept>

namespace rconbridge {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

static std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* v = sqlite3_column_text(stmt, col);
    return v ? reinterpret_cast<const char*>(v) : "";
}

static IdentityLink link_from_stmt(sqlite3_stmt* stmt) {
    IdentityLink link;
    link.source_platform = column_text(stmt, 0);
    link.source_user_id  = column_text(stmt, 1);
    link.target_platform = column_text(stmt, 2);
    link.target_user_id  = column_text(stmt, 3);
    return link;
}

SqliteIdentityStore::SqliteIdentityStore(const std::string& path) : path_(path) {
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw std::runtime_error("SqliteIdentityStore: failed to open database: " + err);
    }

    // The linking flow may write concurrently from another process
    sqlite3_busy_timeout(db_, 2000);
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

    init_schema();
}

SqliteIdentityStore::~SqliteIdentityStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteIdentityStore::init_schema() {
    const char* create_table =
        "CREATE TABLE IF NOT EXISTS user_link ("
        "  source_platform TEXT NOT NULL,"
        "  source_user_id  TEXT NOT NULL,"
        "  target_platform TEXT NOT NULL,"
        "  target_user_id  TEXT NOT NULL,"
        "  PRIMARY KEY(source_platform, source_user_id)"
        ");";
    char* err = nullptr;
    if (sqlite3_exec(db_, create_table, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error("SqliteIdentityStore: schema init failed: " + msg);
    }

    // Reverse lookups (game name -> stream user) are on the hot path too
    sqlite3_exec(db_,
        "CREATE INDEX IF NOT EXISTS user_link_target"
        " ON user_link(target_platform, target_user_id);",
        nullptr, nullptr, nullptr);
}

std::optional<IdentityLink> SqliteIdentityStore::forward(const std::string& source_platform,
                                                         const std::string& source_user_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    const char* sql =
        "SELECT source_platform, source_user_id, target_platform, target_user_id"
        " FROM user_link WHERE source_platform = ? AND source_user_id = ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    sqlite3_bind_text(g.stmt, 1, source_platform.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 2, source_user_id.c_str(), -1, SQLITE_STATIC);

    if (sqlite3_step(g.stmt) == SQLITE_ROW) {
        return link_from_stmt(g.stmt);
    }
    return std::nullopt;
}

std::vector<IdentityLink> SqliteIdentityStore::reverse(const std::string& target_platform,
                                                       const std::string& target_user_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<IdentityLink> links;
    StmtGuard g;
    const char* sql =
        "SELECT source_platform, source_user_id, target_platform, target_user_id"
        " FROM user_link WHERE target_platform = ? AND target_user_id = ?"
        " ORDER BY source_platform, source_user_id;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        return links;
    }
    sqlite3_bind_text(g.stmt, 1, target_platform.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 2, target_user_id.c_str(), -1, SQLITE_STATIC);

    while (sqlite3_step(g.stmt) == SQLITE_ROW) {
        links.push_back(link_from_stmt(g.stmt));
    }
    return links;
}

void SqliteIdentityStore::upsert(const IdentityLink& link) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    const char* sql =
        "INSERT INTO user_link(source_platform, source_user_id, target_platform, target_user_id)"
        " VALUES (?1, ?2, ?3, ?4)"
        " ON CONFLICT(source_platform, source_user_id) DO UPDATE"
        " SET target_platform = ?3, target_user_id = ?4;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("SqliteIdentityStore: prepare failed: ") +
                                 sqlite3_errmsg(db_));
    }
    sqlite3_bind_text(g.stmt, 1, link.source_platform.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 2, link.source_user_id.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 3, link.target_platform.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 4, link.target_user_id.c_str(), -1, SQLITE_STATIC);

    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        throw std::runtime_error(std::string("SqliteIdentityStore: upsert failed: ") +
                                 sqlite3_errmsg(db_));
    }
}

uint32_t SqliteIdentityStore::count() {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM user_link;", -1, &g.stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    if (sqlite3_step(g.stmt) == SQLITE_ROW) {
        return static_cast<uint32_t>(sqlite3_column_int64(g.stmt, 0));
    }
    return 0;
}

} // namespace rconbridge
