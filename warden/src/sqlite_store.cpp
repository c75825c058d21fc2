#include <warden/sqlite_store.hpp>
#include <warden/log.hpp>
#include <warden/types.hpp>

#include <sqlite3.h>

namespace warden {

namespace {

// Finalizes on scope exit so early throws don't leak statements
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            throw StoreError(std::string("prepare failed: ") + sqlite3_errmsg(db));
        }
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int index, const std::string& value) {
        if (sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                              SQLITE_TRANSIENT) != SQLITE_OK) {
            throw StoreError(std::string("bind failed: ") + sqlite3_errmsg(db_));
        }
    }

    void bind(int index, int64_t value) {
        if (sqlite3_bind_int64(stmt_, index, value) != SQLITE_OK) {
            throw StoreError(std::string("bind failed: ") + sqlite3_errmsg(db_));
        }
    }

    // true while rows remain
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw StoreError(std::string("step failed: ") + sqlite3_errmsg(db_));
    }

    std::string column_text(int index) {
        const unsigned char* text = sqlite3_column_text(stmt_, index);
        return text ? reinterpret_cast<const char*>(text) : "";
    }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

nlohmann::json parse_value(const std::string& text, const std::string& key) {
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw StoreError("corrupt value for key '" + key + "': " + e.what());
    }
}

} // namespace

SqliteFactStore::SqliteFactStore(const std::string& path)
    : path_(path) {
    if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw StoreError("cannot open " + path + ": " + message);
    }
    sqlite3_busy_timeout(db_, 5000);
    exec("PRAGMA journal_mode=WAL");
    exec("CREATE TABLE IF NOT EXISTS facts ("
         "namespace TEXT NOT NULL, "
         "key TEXT NOT NULL, "
         "value TEXT NOT NULL, "
         "updated_at INTEGER NOT NULL, "
         "PRIMARY KEY (namespace, key))");
    log::debug("store", "opened %s", path.c_str());
}

SqliteFactStore::~SqliteFactStore() {
    if (db_) sqlite3_close(db_);
}

void SqliteFactStore::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string message = err ? err : "unknown error";
        sqlite3_free(err);
        throw StoreError(std::string("exec failed: ") + message);
    }
}

std::vector<StoreItem> SqliteFactStore::search(const Namespace& ns) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "SELECT key, value FROM facts WHERE namespace = ? ORDER BY key");
    stmt.bind(1, ns.to_string());

    std::vector<StoreItem> items;
    while (stmt.step()) {
        std::string key = stmt.column_text(0);
        items.push_back({key, parse_value(stmt.column_text(1), key)});
    }
    return items;
}

std::optional<nlohmann::json> SqliteFactStore::get(const Namespace& ns, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "SELECT value FROM facts WHERE namespace = ? AND key = ?");
    stmt.bind(1, ns.to_string());
    stmt.bind(2, key);
    if (!stmt.step()) return std::nullopt;
    return parse_value(stmt.column_text(0), key);
}

void SqliteFactStore::put(const Namespace& ns, const std::string& key, const nlohmann::json& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_,
        "INSERT INTO facts (namespace, key, value, updated_at) VALUES (?, ?, ?, ?) "
        "ON CONFLICT (namespace, key) DO UPDATE SET value = excluded.value, "
        "updated_at = excluded.updated_at");
    stmt.bind(1, ns.to_string());
    stmt.bind(2, key);
    stmt.bind(3, value.dump());
    stmt.bind(4, static_cast<int64_t>(now()));
    stmt.step();
}

void SqliteFactStore::remove(const Namespace& ns, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "DELETE FROM facts WHERE namespace = ? AND key = ?");
    stmt.bind(1, ns.to_string());
    stmt.bind(2, key);
    stmt.step();
}

} // namespace warden
