#include "SqliteDatabase.hpp"

#include <sqlite3.h>

#include <sstream>

namespace routedb
{

namespace
{

std::string errorText(sqlite3* db, int rc, const std::string& what)
{
    std::ostringstream oss;
    oss << what << " failed: " << (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc)) << " (rc=" << rc << ")";
    return oss.str();
}

} // namespace

SqliteDatabase::SqliteDatabase(const std::string& path, OpenMode mode)
    : path_(path)
{
    int flags = mode == OpenMode::ReadOnly ? SQLITE_OPEN_READONLY : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK)
    {
        std::string message = errorText(db_, rc, "Opening " + path);
        // sqlite3_open_v2 may hand out a handle even on failure
        sqlite3_close(db_);
        db_ = nullptr;
        throw SqliteError(message, rc);
    }
}

SqliteDatabase::~SqliteDatabase()
{
    if (db_)
    {
        sqlite3_close(db_);
    }
}

void SqliteDatabase::exec(const std::string& sql)
{
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK)
    {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw SqliteError("sqlite exec failed: " + msg, rc);
    }
}

SqliteStatement::SqliteStatement(SqliteDatabase& db, const std::string& sql)
    : db_(db)
{
    check(sqlite3_prepare_v2(db_.handle(), sql.c_str(), -1, &stmt_, nullptr), "Preparing statement");
}

SqliteStatement::~SqliteStatement()
{
    if (stmt_)
    {
        sqlite3_finalize(stmt_);
    }
}

void SqliteStatement::bind(int index, std::int64_t value)
{
    check(sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)), "Binding parameter");
}

void SqliteStatement::bind(int index, const std::string& value)
{
    check(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT),
          "Binding parameter");
}

bool SqliteStatement::step()
{
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW)
    {
        return true;
    }
    check(rc, "Executing statement");
    return false;
}

int SqliteStatement::columnCount() const { return sqlite3_column_count(stmt_); }

bool SqliteStatement::isNull(int column) const { return sqlite3_column_type(stmt_, column) == SQLITE_NULL; }

bool SqliteStatement::isInteger(int column) const { return sqlite3_column_type(stmt_, column) == SQLITE_INTEGER; }

std::int64_t SqliteStatement::columnInt64(int column) const
{
    return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, column));
}

double SqliteStatement::columnDouble(int column) const { return sqlite3_column_double(stmt_, column); }

std::string SqliteStatement::columnText(int column) const
{
    const unsigned char* text = sqlite3_column_text(stmt_, column);
    if (!text)
    {
        return std::string();
    }
    return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(sqlite3_column_bytes(stmt_, column)));
}

void SqliteStatement::check(int rc, const char* what) const
{
    if (rc != SQLITE_OK && rc != SQLITE_DONE && rc != SQLITE_ROW)
    {
        throw SqliteError(errorText(db_.handle(), rc, what), rc);
    }
}

} // namespace routedb
