#include "RouteDbStorage.hpp"
#include "SqliteDatabase.hpp"

#include <plog/Log.h>

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace routedb
{

namespace
{

std::string column(const char* qualifiedName) { return qualifiedName; }

bool fitsInt(std::int64_t value)
{
    return value >= 0 && value <= std::numeric_limits<int>::max();
}

} // namespace

RouteDbStorage::RouteDbStorage(fs::path dataDir, Version supportedVersion)
    : dataDir_(std::move(dataDir))
    , dbPath_(dataDir_ / schema::kDatabaseFileName)
    , supportedVersion_(supportedVersion)
{
}

RouteDbStorage::~RouteDbStorage() = default;

bool RouteDbStorage::start(StorageStartingError& outError)
{
    if (db_)
    {
        PLOG_DEBUG << "Route database already connected";
        return true;
    }

    const std::string path = dbPath_.string();
    PLOG_INFO << "Connecting to route database at: " << path;

    std::unique_ptr<SqliteDatabase> db;
    try
    {
        db = std::make_unique<SqliteDatabase>(path, SqliteDatabase::OpenMode::ReadOnly);
        // SQLite opens lazily, touch the file so that non-database files are refused here
        SqliteStatement touch(*db, "SELECT count(*) FROM sqlite_master");
        touch.step();
    }
    catch (const SqliteError& e)
    {
        outError = InaccessibleStorageError{ path, e.what() };
        PLOG_WARNING << describe(outError);
        return false;
    }

    std::optional<Version> foundVersion;
    try
    {
        SqliteStatement query(*db, "SELECT " + std::string(schema::metadata::kMajorVersion) + ", " +
                                       schema::metadata::kMinorVersion + " FROM " + schema::metadata::kTable +
                                       " LIMIT 1");
        if (!query.step())
        {
            outError = InvalidStorageFormatError{ path, "metadata table is empty" };
        }
        else if (!query.isInteger(0) || !query.isInteger(1))
        {
            outError = InvalidStorageFormatError{ path, "schema version is not an integer" };
        }
        else if (!fitsInt(query.columnInt64(0)) || !fitsInt(query.columnInt64(1)))
        {
            outError = InvalidStorageFormatError{ path, "schema version " + std::to_string(query.columnInt64(0)) +
                                                            "." + std::to_string(query.columnInt64(1)) +
                                                            " is out of range" };
        }
        else
        {
            foundVersion = Version(static_cast<int>(query.columnInt64(0)), static_cast<int>(query.columnInt64(1)));
        }
    }
    catch (const SqliteError& e)
    {
        outError = InvalidStorageFormatError{ path, e.what() };
    }
    catch (const ValidationError& e)
    {
        outError = InvalidStorageFormatError{ path, std::string("invalid schema version: ") + e.what() };
    }

    if (!foundVersion)
    {
        PLOG_WARNING << describe(outError);
        return false;
    }

    if (!supportedVersion_.accepts(*foundVersion))
    {
        outError = IncompatibleStorageError{ path, *foundVersion, supportedVersion_ };
        PLOG_WARNING << describe(outError);
        return false;
    }

    embeddedCreationDate_.reset();
    try
    {
        SqliteStatement query(*db, "SELECT " + std::string(schema::metadata::kCompileTime) + " FROM " +
                                       schema::metadata::kTable + " LIMIT 1");
        utils::Timestamp compileTime;
        if (query.step() && !query.isNull(0) && utils::parseIso8601(query.columnText(0), compileTime))
        {
            embeddedCreationDate_ = compileTime;
        }
    }
    catch (const SqliteError& e)
    {
        PLOG_DEBUG << "No compile time in route database metadata: " << e.what();
    }

    if (!embeddedCreationDate_)
    {
        std::error_code ec;
        auto mtime = fs::last_write_time(dbPath_, ec);
        if (ec)
        {
            PLOG_WARNING << "Cannot read modification time of " << path << ": " << ec.message();
            embeddedCreationDate_ = utils::Timestamp{};
        }
        else
        {
            embeddedCreationDate_ = utils::toSystemTime(mtime);
        }
    }

    db_ = std::move(db);
    PLOG_INFO << "Route database connected (schema " << foundVersion->toString() << ", created "
              << utils::formatIso8601(*embeddedCreationDate_) << ")";
    return true;
}

void RouteDbStorage::stop()
{
    if (db_)
    {
        PLOG_INFO << "Disconnecting route database";
        db_.reset();
    }
    embeddedCreationDate_.reset();
}

bool RouteDbStorage::isConnected() const { return db_ != nullptr; }

bool RouteDbStorage::importFile(const std::string& sourcePath, ImportError& outError)
{
    if (db_)
    {
        throw std::logic_error("importFile() requires a stopped route database storage");
    }

    PLOG_INFO << "Importing route database file " << sourcePath << " to " << dbPath_.string();

    std::error_code ec;
    if (!fs::is_regular_file(sourcePath, ec))
    {
        outError = ImportError{ ImportError::Kind::SourceNotFound, sourcePath,
                                ec ? ec.message() : std::string("not an existing regular file") };
        PLOG_WARNING << describe(outError);
        return false;
    }

    fs::create_directories(dataDir_, ec);
    if (ec)
    {
        outError = ImportError{ ImportError::Kind::CopyFailed, sourcePath,
                                "cannot create " + dataDir_.string() + ": " + ec.message() };
        PLOG_ERROR << describe(outError);
        return false;
    }

    // Copy next to the target first, then rename over it: the live file is either the old or the new one
    fs::path tempPath = dbPath_;
    tempPath += ".import";

    fs::copy_file(sourcePath, tempPath, fs::copy_options::overwrite_existing, ec);
    if (!ec)
    {
        fs::rename(tempPath, dbPath_, ec);
    }
    if (ec)
    {
        outError = ImportError{ ImportError::Kind::CopyFailed, sourcePath, ec.message() };
        PLOG_ERROR << describe(outError);
        std::error_code removeEc;
        fs::remove(tempPath, removeEc);
        if (removeEc)
        {
            PLOG_WARNING << "Failed to remove " << tempPath.string() << ": " << removeEc.message();
        }
        return false;
    }

    PLOG_INFO << "Route database file imported";
    return true;
}

utils::Timestamp RouteDbStorage::creationDate() const
{
    requireConnected("creationDate");
    return *embeddedCreationDate_;
}

std::vector<Summit> RouteDbStorage::retrieveSummits(const std::optional<std::string>& nameFilter)
{
    requireConnected("retrieveSummits");

    std::string sql = "SELECT " + column(schema::summits::kId) + ", " + schema::summits::kName + " FROM " +
                      schema::summits::kTable;
    if (nameFilter)
    {
        PLOG_DEBUG << "Retrieving filtered summit list for \"" << *nameFilter << "\"";
        sql += " WHERE " + column(schema::summits::kName) + " LIKE ?";
    }
    else
    {
        PLOG_DEBUG << "Retrieving complete summit list";
    }
    sql += " ORDER BY " + column(schema::summits::kName);

    SqliteStatement query(*db_, sql);
    if (nameFilter)
    {
        query.bind(1, "%" + *nameFilter + "%");
    }

    std::vector<Summit> summits;
    while (query.step())
    {
        summits.push_back(Summit{ query.columnInt64(0), query.columnText(1) });
    }
    return summits;
}

Summit RouteDbStorage::retrieveSummit(std::int64_t summitId)
{
    requireConnected("retrieveSummit");

    SqliteStatement query(*db_, "SELECT " + column(schema::summits::kId) + ", " + schema::summits::kName +
                                    " FROM " + schema::summits::kTable + " WHERE " + schema::summits::kId + " = ?");
    query.bind(1, summitId);
    if (!query.step())
    {
        throw std::out_of_range("No summit with id " + std::to_string(summitId));
    }
    return Summit{ query.columnInt64(0), query.columnText(1) };
}

std::vector<Route> RouteDbStorage::retrieveRoutesOfSummit(std::int64_t summitId, RoutesSortMode sortMode)
{
    requireConnected("retrieveRoutesOfSummit");

    std::string orderBy;
    switch (sortMode)
    {
    case RoutesSortMode::Name:
        orderBy = column(schema::routes::kName) + " ASC";
        break;
    case RoutesSortMode::Grade:
        orderBy = column(schema::routes::kGrade) + " ASC";
        break;
    case RoutesSortMode::Rating:
        orderBy = "rating DESC";
        break;
    }
    orderBy += ", " + column(schema::routes::kId) + " ASC";

    // LEFT JOIN: routes without any post are listed too (rating NULL)
    SqliteStatement query(*db_, "SELECT " + column(schema::routes::kId) + ", " + schema::routes::kName + ", " +
                                    schema::routes::kGrade + ", AVG(" + schema::posts::kRating + ") AS rating FROM " +
                                    schema::routes::kTable + " LEFT JOIN " + schema::posts::kTable + " ON " +
                                    schema::routes::kId + " = " + schema::posts::kRouteId + " WHERE " +
                                    schema::routes::kSummitId + " = ? GROUP BY " + schema::routes::kId + ", " +
                                    schema::routes::kName + ", " + schema::routes::kGrade + " ORDER BY " + orderBy);
    query.bind(1, summitId);

    std::vector<Route> routes;
    while (query.step())
    {
        Route route;
        route.id = query.columnInt64(0);
        route.name = query.columnText(1);
        route.grade = query.columnText(2);
        if (!query.isNull(3))
        {
            route.rating = query.columnDouble(3);
        }
        routes.push_back(std::move(route));
    }
    return routes;
}

Route RouteDbStorage::retrieveRoute(std::int64_t routeId)
{
    requireConnected("retrieveRoute");

    SqliteStatement query(*db_, "SELECT " + column(schema::routes::kId) + ", " + schema::routes::kName + ", " +
                                    schema::routes::kGrade + " FROM " + schema::routes::kTable + " WHERE " +
                                    schema::routes::kId + " = ?");
    query.bind(1, routeId);
    if (!query.step())
    {
        throw std::out_of_range("No route with id " + std::to_string(routeId));
    }

    Route route;
    route.id = query.columnInt64(0);
    route.name = query.columnText(1);
    route.grade = query.columnText(2);
    return route;
}

std::vector<Post> RouteDbStorage::retrievePostsOfRoute(std::int64_t routeId, PostsSortMode sortMode)
{
    requireConnected("retrievePostsOfRoute");
    PLOG_DEBUG << "Retrieving posts for route " << routeId;

    std::string orderBy = column(schema::posts::kPostDate) + (sortMode == PostsSortMode::NewestFirst ? " DESC" : " ASC");
    SqliteStatement query(*db_, "SELECT " + column(schema::posts::kUserName) + ", " + schema::posts::kPostDate + ", " +
                                    schema::posts::kComment + ", " + schema::posts::kRating + " FROM " +
                                    schema::posts::kTable + " WHERE " + schema::posts::kRouteId + " = ? ORDER BY " +
                                    orderBy);
    query.bind(1, routeId);

    std::vector<Post> posts;
    while (query.step())
    {
        Post post;
        post.userName = query.columnText(0);
        std::string postDate = query.columnText(1);
        if (!utils::parseIso8601(postDate, post.postDate))
        {
            throw std::runtime_error("Invalid post date '" + postDate + "' for route " + std::to_string(routeId));
        }
        post.comment = query.columnText(2);
        post.rating = static_cast<int>(query.columnInt64(3));
        posts.push_back(std::move(post));
    }
    return posts;
}

void RouteDbStorage::requireConnected(const char* operation) const
{
    if (!db_)
    {
        throw std::logic_error(std::string(operation) + "() requires a started route database storage");
    }
}

} // namespace routedb
