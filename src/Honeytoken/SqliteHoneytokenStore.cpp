#include "SqliteHoneytokenStore.hpp"
#include "Logger.hpp"
#include <ctime>
#include <iostream>

static const char* kHoneytokenSchemaSQL = R"SQL(
CREATE TABLE IF NOT EXISTS honeytokens (
  value       TEXT PRIMARY KEY,
  label       TEXT NOT NULL DEFAULT '',
  created_ts  INTEGER NOT NULL
);

CREATE TABLE IF NOT EXISTS honeytoken_alerts (
  id        INTEGER PRIMARY KEY AUTOINCREMENT,
  value     TEXT NOT NULL,
  category  TEXT NOT NULL,
  ts        INTEGER NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_alerts_ts ON honeytoken_alerts(ts);
)SQL";


// Desc: ensure honeytoken tables exist in SQLite DB
// In: sqlite3* db
// Out: bool (true on success)
bool SqliteHoneytokenStore::ensure_schema(sqlite3* db) {
    if (!db) return false;
    char* err = nullptr;
    if (sqlite3_exec(db, kHoneytokenSchemaSQL, nullptr, nullptr, &err) != SQLITE_OK) {
        std::cerr << "[SqliteHoneytokenStore] schema exec failed: " << (err ? err : "unknown") << "\n";
        if (err) sqlite3_free(err);
        return false;
    }
    return true;
}

// Desc: register a bait value (idempotent)
// In: const std::string& value, const std::string& label
// Out: bool (true on success)
bool SqliteHoneytokenStore::add(const std::string& value, const std::string& label) {
    if (!db_) return false;
    const char* sql = "INSERT OR IGNORE INTO honeytokens(value, label, created_ts) VALUES(?, ?, ?);";
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &st, nullptr) != SQLITE_OK) {
        std::cerr << "[SqliteHoneytokenStore] prepare failed: " << sqlite3_errmsg(db_) << "\n";
        return false;
    }
    sqlite3_bind_text(st, 1, value.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(st, 2, label.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(st, 3, static_cast<sqlite3_int64>(time(nullptr)));
    const int rc = sqlite3_step(st);
    (void)sqlite3_finalize(st);
    return rc == SQLITE_DONE;
}

SqliteHoneytokenStore::~SqliteHoneytokenStore() {
    if (lookup_stmt_) (void)sqlite3_finalize(lookup_stmt_);
}

// Desc: exact-value lookup on the cached statement
// In: const std::string& value
// Out: bool (false on any SQLite error)
bool SqliteHoneytokenStore::is_honeytoken(const std::string& value) const {
    if (!db_) return false;
    if (!lookup_stmt_ &&
        sqlite3_prepare_v2(db_, "SELECT 1 FROM honeytokens WHERE value=? LIMIT 1;", -1, &lookup_stmt_, nullptr) != SQLITE_OK) {
        std::cerr << "[SqliteHoneytokenStore] lookup prepare failed: " << sqlite3_errmsg(db_) << "\n";
        lookup_stmt_ = nullptr;
        return false;
    }
    (void)sqlite3_reset(lookup_stmt_);
    (void)sqlite3_clear_bindings(lookup_stmt_);
    if (sqlite3_bind_text(lookup_stmt_, 1, value.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK) return false;
    const bool found = sqlite3_step(lookup_stmt_) == SQLITE_ROW;
    (void)sqlite3_reset(lookup_stmt_);
    return found;
}

// Desc: persist the alert, log it, then forward to the callback
// In: const AlertEvent& event
// Out: void
void SqliteHoneytokenStore::on_detected(const AlertEvent& event) {
    log_line(log_fd_, "Honeytoken", format_alert(event));

    if (db_) {
        const char* sql = "INSERT INTO honeytoken_alerts(value, category, ts) VALUES(?, ?, ?);";
        sqlite3_stmt* st = nullptr;
        if (sqlite3_prepare_v2(db_, sql, -1, &st, nullptr) == SQLITE_OK) {
            sqlite3_bind_text(st, 1, event.value.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(st, 2, event.category.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int64(st, 3, static_cast<sqlite3_int64>(
                                          std::chrono::system_clock::to_time_t(event.timestamp)));
            if (sqlite3_step(st) != SQLITE_DONE) {
                log_line(log_fd_, "Honeytoken", std::string("alert insert failed: ") + sqlite3_errmsg(db_));
            }
            (void)sqlite3_finalize(st);
        } else {
            log_line(log_fd_, "Honeytoken", std::string("alert prepare failed: ") + sqlite3_errmsg(db_));
        }
    }

    if (callback_) callback_(event);
}

std::int64_t SqliteHoneytokenStore::count_rows_(const char* sql) const {
    if (!db_) return 0;
    std::int64_t n = 0;
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &st, nullptr) == SQLITE_OK) {
        if (sqlite3_step(st) == SQLITE_ROW) n = sqlite3_column_int64(st, 0);
        (void)sqlite3_finalize(st);
    }
    return n;
}

std::int64_t SqliteHoneytokenStore::token_count() const {
    return count_rows_("SELECT COUNT(*) FROM honeytokens;");
}

std::int64_t SqliteHoneytokenStore::alert_count() const {
    return count_rows_("SELECT COUNT(*) FROM honeytoken_alerts;");
}
