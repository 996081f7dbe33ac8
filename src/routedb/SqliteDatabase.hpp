#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace routedb
{

// Error reported by the SQLite engine
class SqliteError : public std::runtime_error
{
public:
    SqliteError(const std::string& what, int resultCode)
        : std::runtime_error(what)
        , resultCode_(resultCode)
    {
    }

    int resultCode() const { return resultCode_; }

private:
    int resultCode_;
};

// Owning handle of an open SQLite connection
class SqliteDatabase
{
public:
    enum class OpenMode
    {
        ReadOnly, // Fails if the file does not exist
        ReadWriteCreate
    };

    // Throws SqliteError if the file cannot be opened
    SqliteDatabase(const std::string& path, OpenMode mode);
    ~SqliteDatabase();

    SqliteDatabase(const SqliteDatabase&) = delete;
    SqliteDatabase& operator=(const SqliteDatabase&) = delete;

    // Run one or more statements without results (throws SqliteError)
    void exec(const std::string& sql);

    const std::string& path() const { return path_; }

    sqlite3* handle() const { return db_; }

private:
    sqlite3* db_ = nullptr;
    std::string path_;
};

// Prepared statement bound to a SqliteDatabase, finalized on destruction
class SqliteStatement
{
public:
    // Throws SqliteError if the SQL cannot be compiled (e.g. unknown table)
    SqliteStatement(SqliteDatabase& db, const std::string& sql);
    ~SqliteStatement();

    SqliteStatement(const SqliteStatement&) = delete;
    SqliteStatement& operator=(const SqliteStatement&) = delete;

    // Parameter indices start at 1
    void bind(int index, std::int64_t value);
    void bind(int index, const std::string& value);

    // Returns true while a result row is available, false when done
    bool step();

    int columnCount() const;
    bool isNull(int column) const;
    bool isInteger(int column) const;
    std::int64_t columnInt64(int column) const;
    double columnDouble(int column) const;
    std::string columnText(int column) const;

private:
    void check(int rc, const char* what) const;

    SqliteDatabase& db_;
    sqlite3_stmt* stmt_ = nullptr;
};

} // namespace routedb
