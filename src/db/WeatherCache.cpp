#include "db/WeatherCache.h"

#include <sqlite3.h>
#include <iostream>
#include <memory>

namespace {

struct StmtDeleter {
    void operator()(sqlite3_stmt* stmt) const {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }
};

using StmtPtr = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

StmtPtr Prepare(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "SQLite prepare failed: " << sqlite3_errmsg(db) << "\n";
        return nullptr;
    }
    return StmtPtr(stmt);
}

std::string ColumnText(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

} // namespace

WeatherCache::WeatherCache(const std::string& db_path) : db_path_(db_path) {}

WeatherCache::~WeatherCache() {
    Close();
}

bool WeatherCache::Open() {
    if (sqlite3_open_v2(db_path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr) != SQLITE_OK) {
        std::cerr << "SQLite open failed: " << sqlite3_errmsg(db_) << "\n";
        Close();
        return false;
    }
    sqlite3_busy_timeout(db_, 2000);
    Exec("PRAGMA journal_mode=WAL;");
    return InitSchema();
}

void WeatherCache::Close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool WeatherCache::Exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::cerr << "SQLite exec failed: " << (err ? err : "unknown") << "\n";
        sqlite3_free(err);
        return false;
    }
    return true;
}

bool WeatherCache::InitSchema() {
    const char* responses_sql =
        "CREATE TABLE IF NOT EXISTS responses("
        "location TEXT NOT NULL,"
        "date TEXT NOT NULL,"
        "body TEXT,"
        "fetched_ts INTEGER,"
        "PRIMARY KEY(location, date)"
        ");";

    const char* meta_sql =
        "CREATE TABLE IF NOT EXISTS meta("
        "key TEXT PRIMARY KEY,"
        "value TEXT"
        ");";

    return Exec(responses_sql) && Exec(meta_sql);
}

bool WeatherCache::PutResponse(const CachedResponse& response) {
    const char* sql =
        "INSERT INTO responses(location, date, body, fetched_ts) VALUES(?, ?, ?, ?)"
        " ON CONFLICT(location, date) DO UPDATE SET"
        " body=excluded.body,"
        " fetched_ts=excluded.fetched_ts";

    auto stmt = Prepare(db_, sql);
    if (!stmt) {
        return false;
    }

    sqlite3_bind_text(stmt.get(), 1, response.location.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 2, response.date.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 3, response.body.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt.get(), 4, response.fetched_ts);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        std::cerr << "SQLite upsert failed: " << sqlite3_errmsg(db_) << "\n";
        return false;
    }
    return true;
}

bool WeatherCache::GetResponse(const std::string& location, const std::string& date, CachedResponse* out) {
    const char* sql =
        "SELECT location, date, body, fetched_ts FROM responses WHERE location = ? AND date = ?";

    auto stmt = Prepare(db_, sql);
    if (!stmt) {
        return false;
    }

    sqlite3_bind_text(stmt.get(), 1, location.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 2, date.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        out->location = ColumnText(stmt.get(), 0);
        out->date = ColumnText(stmt.get(), 1);
        out->body = ColumnText(stmt.get(), 2);
        out->fetched_ts = sqlite3_column_int64(stmt.get(), 3);
        return true;
    }
    return false;
}

bool WeatherCache::RemoveResponse(const std::string& location, const std::string& date) {
    auto stmt = Prepare(db_, "DELETE FROM responses WHERE location = ? AND date = ?");
    if (!stmt) {
        return false;
    }

    sqlite3_bind_text(stmt.get(), 1, location.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 2, date.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        std::cerr << "SQLite delete failed: " << sqlite3_errmsg(db_) << "\n";
        return false;
    }
    return true;
}

int WeatherCache::CountResponses() {
    auto stmt = Prepare(db_, "SELECT COUNT(*) FROM responses");
    if (!stmt) {
        return 0;
    }
    if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        return sqlite3_column_int(stmt.get(), 0);
    }
    return 0;
}

bool WeatherCache::SetMeta(const std::string& key, const std::string& value) {
    const char* sql =
        "INSERT INTO meta(key, value) VALUES(?, ?)"
        " ON CONFLICT(key) DO UPDATE SET value=excluded.value";

    auto stmt = Prepare(db_, sql);
    if (!stmt) {
        return false;
    }

    sqlite3_bind_text(stmt.get(), 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 2, value.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        std::cerr << "SQLite set meta failed: " << sqlite3_errmsg(db_) << "\n";
        return false;
    }
    return true;
}

std::string WeatherCache::GetMeta(const std::string& key) {
    auto stmt = Prepare(db_, "SELECT value FROM meta WHERE key = ?");
    if (!stmt) {
        return "";
    }

    sqlite3_bind_text(stmt.get(), 1, key.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        return ColumnText(stmt.get(), 0);
    }
    return "";
}
