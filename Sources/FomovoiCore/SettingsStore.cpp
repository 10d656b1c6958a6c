#include "SettingsStore.hpp"
#include "Ids.hpp"
#include "Logger.hpp"

#include <filesystem>

#include <sqlite3.h>

namespace fv {

// ---------------------------------------------------------------------------
// RAII helper for SQLite transactions
// ---------------------------------------------------------------------------

class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) {
        sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr);
    }
    void commit() {
        if (!committed_) {
            sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr);
            committed_ = true;
        }
    }
    ~Transaction() {
        if (!committed_) {
            sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        }
    }

private:
    sqlite3* db_;
    bool committed_ = false;
};

// ---------------------------------------------------------------------------
// RAII helper for SQLite prepared statements
// ---------------------------------------------------------------------------

class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        int rc = sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr);
        if (rc != SQLITE_OK) {
            FV_LOG_ERROR("SettingsStore", std::string("prepare failed: ") + sqlite3_errmsg(db));
            stmt_ = nullptr;
        }
    }
    ~Statement() {
        if (stmt_) sqlite3_finalize(stmt_);
    }
    operator sqlite3_stmt*() const { return stmt_; }
    bool ok() const { return stmt_ != nullptr; }

private:
    sqlite3_stmt* stmt_ = nullptr;
};

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

SettingsStore::SettingsStore(const std::string& db_path)
    : db_path_(db_path) {}

SettingsStore::~SettingsStore() {
    close();
}

// ---------------------------------------------------------------------------
// open / close / is_open
// ---------------------------------------------------------------------------

bool SettingsStore::open() {
    std::lock_guard<std::mutex> lock(mu_);

    if (db_) return true;   // already open

    if (db_path_.empty()) return false;

    if (db_path_ != ":memory:") {
        auto parent = std::filesystem::path(db_path_).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                FV_LOG_ERROR("SettingsStore", "Cannot create " + parent.string() + ": " + ec.message());
                return false;
            }
        }
    }

    int rc = sqlite3_open(db_path_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        FV_LOG_ERROR("SettingsStore", "Cannot open " + db_path_ + ": "
                     + (db_ ? sqlite3_errmsg(db_) : "out of memory"));
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return false;
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL", nullptr, nullptr, nullptr);

    if (!create_tables()) {
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }
    FV_LOG_DEBUG("SettingsStore", "Opened " + db_path_);
    return true;
}

void SettingsStore::close() {
    std::lock_guard<std::mutex> lock(mu_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool SettingsStore::is_open() const {
    std::lock_guard<std::mutex> lock(mu_);
    return db_ != nullptr;
}

bool SettingsStore::create_tables() {
    const char* sql = R"SQL(
        CREATE TABLE IF NOT EXISTS settings (
            key TEXT PRIMARY KEY,
            value TEXT NOT NULL,
            updated_at INTEGER NOT NULL
        );
    )SQL";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        FV_LOG_ERROR("SettingsStore", std::string("Schema creation failed: ") + (err ? err : "unknown"));
        if (err) sqlite3_free(err);
        return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// Key/value operations
// ---------------------------------------------------------------------------

std::optional<std::string> SettingsStore::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) return std::nullopt;

    Statement stmt(db_, "SELECT value FROM settings WHERE key = ?");
    if (!stmt.ok()) return std::nullopt;

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(stmt) != SQLITE_ROW) return std::nullopt;

    auto text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
    return std::string(text ? text : "");
}

bool SettingsStore::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) return false;

    Transaction txn(db_);

    const char* sql =
        "INSERT INTO settings (key, value, updated_at) VALUES (?, ?, ?) "
        "ON CONFLICT(key) DO UPDATE SET value = excluded.value, "
        "updated_at = excluded.updated_at";
    Statement stmt(db_, sql);
    if (!stmt.ok()) return false;

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 3, now_unix());

    if (sqlite3_step(stmt) != SQLITE_DONE) {
        FV_LOG_ERROR("SettingsStore", "Write of '" + key + "' failed: " + sqlite3_errmsg(db_));
        return false;
    }

    txn.commit();
    return true;
}

bool SettingsStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) return false;

    Transaction txn(db_);

    Statement stmt(db_, "DELETE FROM settings WHERE key = ?");
    if (!stmt.ok()) return false;

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt) != SQLITE_DONE) return false;

    txn.commit();
    return true;
}

std::vector<std::string> SettingsStore::keys() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<std::string> out;
    if (!db_) return out;

    Statement stmt(db_, "SELECT key FROM settings ORDER BY key");
    if (!stmt.ok()) return out;

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        auto text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        out.emplace_back(text ? text : "");
    }
    return out;
}

bool SettingsStore::get_bool(const std::string& key, bool fallback) const {
    auto v = get(key);
    if (!v) return fallback;
    return *v == "1" || *v == "true";
}

bool SettingsStore::set_bool(const std::string& key, bool value) {
    return set(key, value ? "1" : "0");
}

} // namespace fv
