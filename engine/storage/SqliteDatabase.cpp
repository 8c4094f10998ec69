#include "SqliteDatabase.h"

#include <sqlite3.h>

#include "../core/Logger.h"

namespace Engine {

SqliteDatabase::~SqliteDatabase() { close(); }

bool SqliteDatabase::open(const std::string& path) {
    close();
    if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
        logError("[DB] Failed to open " + path + ": " + std::string(sqlite3_errmsg(db_)));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }
    path_ = path;
    if (sqlite3_exec(db_, "PRAGMA foreign_keys = ON", nullptr, nullptr, nullptr) != SQLITE_OK) {
        logWarn("[DB] Could not enable foreign keys on " + path + ": " + lastError());
    }
    logDebug("[DB] Opened " + path);
    return true;
}

void SqliteDatabase::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
        logDebug("[DB] Closed " + path_);
    }
}

void SqliteDatabase::exec(const std::string& sql) {
    if (!db_) throw SqliteError("database is not open", SQLITE_MISUSE);
    char* err = nullptr;
    const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string message = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        throw SqliteError("exec failed: " + message, rc);
    }
}

int64_t SqliteDatabase::lastInsertRowId() const { return db_ ? sqlite3_last_insert_rowid(db_) : 0; }

int SqliteDatabase::changes() const { return db_ ? sqlite3_changes(db_) : 0; }

std::string SqliteDatabase::lastError() const { return db_ ? sqlite3_errmsg(db_) : "database is not open"; }

SqliteStatement::SqliteStatement(SqliteDatabase& db, std::string_view sql) : db_(&db) {
    if (!db.isOpen()) throw SqliteError("database is not open", SQLITE_MISUSE);
    const int rc = sqlite3_prepare_v2(db.handle(), sql.data(), static_cast<int>(sql.size()), &stmt_, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = db.lastError();
        sqlite3_finalize(stmt_);
        stmt_ = nullptr;
        throw SqliteError("prepare failed: " + message, rc);
    }
}

SqliteStatement::~SqliteStatement() {
    if (stmt_) sqlite3_finalize(stmt_);
}

SqliteStatement::SqliteStatement(SqliteStatement&& other) noexcept : db_(other.db_), stmt_(other.stmt_) {
    other.stmt_ = nullptr;
}

void SqliteStatement::check(int rc, const char* what) const {
    if (rc != SQLITE_OK) throw SqliteError(std::string(what) + " failed: " + db_->lastError(), rc);
}

void SqliteStatement::bindText(int index, std::string_view value) {
    check(sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT),
          "bind text");
}

void SqliteStatement::bindOptionalText(int index, const std::optional<std::string>& value) {
    if (value.has_value()) {
        bindText(index, *value);
    } else {
        bindNull(index);
    }
}

void SqliteStatement::bindInt64(int index, int64_t value) {
    check(sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)), "bind int64");
}

void SqliteStatement::bindNull(int index) { check(sqlite3_bind_null(stmt_, index), "bind null"); }

bool SqliteStatement::step() {
    const int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw SqliteError("step failed: " + db_->lastError(), rc);
}

void SqliteStatement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

std::string SqliteStatement::columnText(int column) const {
    const unsigned char* text = sqlite3_column_text(stmt_, column);
    if (!text) return {};
    return std::string(reinterpret_cast<const char*>(text), static_cast<std::size_t>(sqlite3_column_bytes(stmt_, column)));
}

std::optional<std::string> SqliteStatement::columnOptionalText(int column) const {
    if (columnIsNull(column)) return std::nullopt;
    return columnText(column);
}

int64_t SqliteStatement::columnInt64(int column) const {
    return static_cast<int64_t>(sqlite3_column_int64(stmt_, column));
}

bool SqliteStatement::columnIsNull(int column) const { return sqlite3_column_type(stmt_, column) == SQLITE_NULL; }

SqliteTransaction::SqliteTransaction(SqliteDatabase& db) : db_(db) { db_.exec("BEGIN IMMEDIATE TRANSACTION"); }

SqliteTransaction::~SqliteTransaction() {
    if (finished_) return;
    // Destructors must not throw; a failed rollback is only reported.
    char* err = nullptr;
    if (sqlite3_exec(db_.handle(), "ROLLBACK", nullptr, nullptr, &err) != SQLITE_OK) {
        logError("[DB] Rollback failed: " + std::string(err ? err : "unknown error"));
    }
    sqlite3_free(err);
}

void SqliteTransaction::commit() {
    if (finished_) return;
    db_.exec("COMMIT");
    finished_ = true;
}

void SqliteTransaction::rollback() {
    if (finished_) return;
    finished_ = true;
    db_.exec("ROLLBACK");
}

}  // namespace Engine
