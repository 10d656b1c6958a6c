#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Forward-declare sqlite3 so we don't leak its header into consumers.
struct sqlite3;

namespace fv {

/// Small persisted key/value store backed by SQLite.
///
/// Holds the selected bundle id, the language hint, the translate flag and
/// the cached discovery catalog.  Uses WAL mode; every write runs in its
/// own transaction.
class SettingsStore {
public:
    // ---- Well-known keys ----
    static constexpr const char* kSelectedBundle     = "selected_bundle";
    static constexpr const char* kLanguageHint       = "language_hint";
    static constexpr const char* kTranslateToEnglish = "translate_to_english";
    static constexpr const char* kCatalogCache       = "catalog_cache";

    /// `db_path` may be ":memory:" for a throwaway store.
    explicit SettingsStore(const std::string& db_path);
    ~SettingsStore();

    // Non-copyable.
    SettingsStore(const SettingsStore&) = delete;
    SettingsStore& operator=(const SettingsStore&) = delete;

    /// Open (or create) the database and its table.  Returns false on failure.
    bool open();

    void close();

    bool is_open() const;

    std::optional<std::string> get(const std::string& key) const;

    /// Insert or replace.
    bool set(const std::string& key, const std::string& value);

    bool remove(const std::string& key);

    std::vector<std::string> keys() const;

    // ---- Typed helpers ----

    bool get_bool(const std::string& key, bool fallback) const;
    bool set_bool(const std::string& key, bool value);

private:
    bool create_tables();

    std::string        db_path_;
    sqlite3*           db_ = nullptr;
    mutable std::mutex mu_;
};

} // namespace fv
