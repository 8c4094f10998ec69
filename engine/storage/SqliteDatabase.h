// RAII wrappers around a SQLite connection, prepared statements and transactions.
#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

struct sqlite3;
struct sqlite3_stmt;

namespace Engine {

class SqliteError : public std::runtime_error {
public:
    SqliteError(const std::string& what, int code) : std::runtime_error(what), code_(code) {}
    int code() const { return code_; }

private:
    int code_;
};

class SqliteDatabase {
public:
    SqliteDatabase() = default;
    ~SqliteDatabase();

    SqliteDatabase(const SqliteDatabase&) = delete;
    SqliteDatabase& operator=(const SqliteDatabase&) = delete;

    // Opens (or creates) the database file; ":memory:" gives a private in-memory db.
    bool open(const std::string& path);
    void close();
    bool isOpen() const { return db_ != nullptr; }

    // Runs one or more statements with no result rows. Throws SqliteError.
    void exec(const std::string& sql);

    int64_t lastInsertRowId() const;
    int changes() const;
    std::string lastError() const;

    sqlite3* handle() const { return db_; }

private:
    sqlite3* db_{nullptr};
    std::string path_;
};

class SqliteStatement {
public:
    SqliteStatement(SqliteDatabase& db, std::string_view sql);
    ~SqliteStatement();

    SqliteStatement(const SqliteStatement&) = delete;
    SqliteStatement& operator=(const SqliteStatement&) = delete;
    SqliteStatement(SqliteStatement&& other) noexcept;

    // Parameter indices are 1-based, as in sqlite3_bind_*.
    void bindText(int index, std::string_view value);
    void bindOptionalText(int index, const std::optional<std::string>& value);
    void bindInt64(int index, int64_t value);
    void bindNull(int index);

    // Returns true while a row is available, false once the statement is done.
    bool step();
    // Clears bindings and rewinds so the statement can run again.
    void reset();

    std::string columnText(int column) const;
    std::optional<std::string> columnOptionalText(int column) const;
    int64_t columnInt64(int column) const;
    bool columnIsNull(int column) const;

private:
    void check(int rc, const char* what) const;

    SqliteDatabase* db_;
    sqlite3_stmt* stmt_{nullptr};
};

// Begins on construction; rolls back on destruction unless commit() succeeded.
class SqliteTransaction {
public:
    explicit SqliteTransaction(SqliteDatabase& db);
    ~SqliteTransaction();

    SqliteTransaction(const SqliteTransaction&) = delete;
    SqliteTransaction& operator=(const SqliteTransaction&) = delete;

    void commit();
    void rollback();

private:
    SqliteDatabase& db_;
    bool finished_{false};
};

}  // namespace Engine
