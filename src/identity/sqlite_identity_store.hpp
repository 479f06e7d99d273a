#pragma once
#include "../identity_store.hpp"
#include <mutex>
#include <string>

struct sqlite3; // forward declare

namespace rconbridge {

// user_link table:
//   (source_platform, source_user_id) PRIMARY KEY -> (target_platform, target_user_id)
// The table is created when missing so a fresh install works; an existing
// schema is used as is.
class SqliteIdentityStore : public IdentityLinkStore {
public:
    explicit SqliteIdentityStore(const std::string& path);
    ~SqliteIdentityStore() override;

    // Non-copyable
    SqliteIdentityStore(const SqliteIdentityStore&) = delete;
    SqliteIdentityStore& operator=(const SqliteIdentityStore&) = delete;

    std::string backend_name() const override { return "sqlite"; }

    std::optional<IdentityLink> forward(const std::string& source_platform,
                                        const std::string& source_user_id) override;

    std::vector<IdentityLink> reverse(const std::string& target_platform,
                                      const std::string& target_user_id) override;

    // Admin path (the --link command); the relay itself never writes.
    // Throws std::runtime_error on SQLite failure.
    void upsert(const IdentityLink& link);

    uint32_t count();

private:
    void init_schema();

    sqlite3* db_ = nullptr;
    std::string path_;
    mutable std::mutex mutex_;
};

} // namespace rconbridge
