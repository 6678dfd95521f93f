#pragma once
#include "Honeytoken.hpp"
#include <cstdint>
#include <string>
#include <utility>
#include <sqlite3.h>

// Honeytoken lookup backed by a SQLite table; detections are recorded in
// honeytoken_alerts. The database handle is borrowed, not owned.
class SqliteHoneytokenStore : public HoneytokenHandler {
public:
    explicit SqliteHoneytokenStore(sqlite3* db, AlertCallback callback = nullptr, int log_fd = 2)
        : db_(db), callback_(std::move(callback)), log_fd_(log_fd) {}
    ~SqliteHoneytokenStore() override;

    SqliteHoneytokenStore(const SqliteHoneytokenStore&) = delete;
    SqliteHoneytokenStore& operator=(const SqliteHoneytokenStore&) = delete;

    // Create tables/indexes if missing.
    static bool ensure_schema(sqlite3* db);

    bool add(const std::string& value, const std::string& label = "");
    std::int64_t token_count() const;
    std::int64_t alert_count() const;

    bool is_honeytoken(const std::string& value) const override;
    void on_detected(const AlertEvent& event) override;

private:
    std::int64_t count_rows_(const char* sql) const;

    sqlite3* db_{nullptr};
    AlertCallback callback_;
    int log_fd_;
    // Prepared on first lookup, reset per call, finalized with the store.
    mutable sqlite3_stmt* lookup_stmt_{nullptr};
};
