#pragma once
// SQLite-backed fact store
//
// One table, one row per (namespace, key), value stored as JSON text:
//
//   CREATE TABLE facts (namespace TEXT, key TEXT, value TEXT,
//                       updated_at INTEGER, PRIMARY KEY (namespace, key))
//
// A single connection guarded by a mutex; ":memory:" works for tests.

#include "fact_store.hpp"
#include <mutex>
#include <string>

struct sqlite3;

namespace warden {

class SqliteFactStore : public FactStore {
public:
    // Opens (creating if needed) the database. Throws StoreError.
    explicit SqliteFactStore(const std::string& path);
    ~SqliteFactStore() override;

    SqliteFactStore(const SqliteFactStore&) = delete;
    SqliteFactStore& operator=(const SqliteFactStore&) = delete;

    std::vector<StoreItem> search(const Namespace& ns) override;
    std::optional<nlohmann::json> get(const Namespace& ns, const std::string& key) override;
    void put(const Namespace& ns, const std::string& key, const nlohmann::json& value) override;
    void remove(const Namespace& ns, const std::string& key) override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    sqlite3* db_ = nullptr;
    std::mutex mutex_;

    void exec(const char* sql);
};

} // namespace warden
