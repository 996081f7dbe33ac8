#pragma once

#include "IRouteDbStorage.hpp"
#include "RouteDbSchema.hpp"
#include "Version.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace routedb
{

class SqliteDatabase;

// SQLite backed route database living at <dataDir>/peaks.sqlite
class RouteDbStorage : public IRouteDbStorage
{
public:
    explicit RouteDbStorage(std::filesystem::path dataDir, Version supportedVersion = schema::supportedVersion());
    ~RouteDbStorage() override;

    RouteDbStorage(const RouteDbStorage&) = delete;
    RouteDbStorage& operator=(const RouteDbStorage&) = delete;

    bool start(StorageStartingError& outError) override;
    void stop() override;
    bool isConnected() const override;

    bool importFile(const std::string& sourcePath, ImportError& outError) override;

    utils::Timestamp creationDate() const override;

    std::vector<Summit> retrieveSummits(const std::optional<std::string>& nameFilter = std::nullopt) override;
    Summit retrieveSummit(std::int64_t summitId) override;
    std::vector<Route> retrieveRoutesOfSummit(std::int64_t summitId, RoutesSortMode sortMode) override;
    Route retrieveRoute(std::int64_t routeId) override;
    std::vector<Post> retrievePostsOfRoute(std::int64_t routeId, PostsSortMode sortMode) override;

    const std::filesystem::path& databasePath() const { return dbPath_; }

    const Version& supportedVersion() const { return supportedVersion_; }

private:
    void requireConnected(const char* operation) const;

    std::filesystem::path dataDir_;
    std::filesystem::path dbPath_;
    Version supportedVersion_;

    std::unique_ptr<SqliteDatabase> db_;
    // compile_time of the metadata row, if it could be parsed
    std::optional<utils::Timestamp> embeddedCreationDate_;
};

} // namespace routedb
