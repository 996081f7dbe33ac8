#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "routedb/RouteDbStorage.hpp"
#include "routedb/SqliteDatabase.hpp"
#include "utils/routedb_fixture.hpp"

#include <variant>

using namespace routedb;
using namespace std::chrono;
using test_utils::RouteDbFixture;
using test_utils::ScopedTempDir;

namespace fs = std::filesystem;

namespace {

utils::Timestamp utc(int y, unsigned m, unsigned d, int hh = 0, int mm = 0, int ss = 0) {
    return time_point_cast<system_clock::duration>(sys_days{year{y} / month{m} / day{d}} + hours{hh} +
                                                   minutes{mm} + seconds{ss});
}

}  // namespace

TEST_CASE("Route database start", "[routedb][storage]") {
    ScopedTempDir tmp;
    const fs::path dbFile = tmp.path() / "peaks.sqlite";
    RouteDbStorage storage(tmp.path());
    StorageStartingError error;

    REQUIRE(storage.databasePath() == dbFile);
    REQUIRE_FALSE(storage.isConnected());

    SECTION("Missing file is inaccessible and not created") {
        REQUIRE_FALSE(storage.start(error));
        REQUIRE(std::holds_alternative<InaccessibleStorageError>(error));
        REQUIRE(std::get<InaccessibleStorageError>(error).path == dbFile.string());
        REQUIRE_FALSE(storage.isConnected());
        REQUIRE_FALSE(fs::exists(dbFile));
    }

    SECTION("Non-database file is inaccessible") {
        test_utils::writeFile(dbFile, std::string(4096, 'x'));
        REQUIRE_FALSE(storage.start(error));
        REQUIRE(std::holds_alternative<InaccessibleStorageError>(error));
        REQUIRE_FALSE(storage.isConnected());
    }

    SECTION("Database without metadata table is invalid") {
        RouteDbFixture fixture;
        fixture.with_metadata = false;
        test_utils::createRouteDb(dbFile, fixture);

        REQUIRE_FALSE(storage.start(error));
        REQUIRE(std::holds_alternative<InvalidStorageFormatError>(error));
        REQUIRE_FALSE(storage.isConnected());
    }

    SECTION("Empty metadata table is invalid") {
        {
            SqliteDatabase db(dbFile.string(), SqliteDatabase::OpenMode::ReadWriteCreate);
            db.exec("CREATE TABLE database_metadata (id INTEGER PRIMARY KEY, schema_version_major INTEGER,"
                    " schema_version_minor INTEGER, compile_time TEXT, vendor TEXT);");
        }
        REQUIRE_FALSE(storage.start(error));
        REQUIRE(std::holds_alternative<InvalidStorageFormatError>(error));
    }

    SECTION("Non-integer schema version is invalid") {
        {
            SqliteDatabase db(dbFile.string(), SqliteDatabase::OpenMode::ReadWriteCreate);
            db.exec("CREATE TABLE database_metadata (schema_version_major, schema_version_minor);"
                    "INSERT INTO database_metadata VALUES ('one', 'zero');");
        }
        REQUIRE_FALSE(storage.start(error));
        REQUIRE(std::holds_alternative<InvalidStorageFormatError>(error));
    }

    SECTION("Schema version beyond the integer range is invalid") {
        RouteDbFixture fixture;
        fixture.major = 4294967297LL;  // 2^32 + 1, truncates to 1
        test_utils::createRouteDb(dbFile, fixture);

        REQUIRE_FALSE(storage.start(error));
        REQUIRE(std::holds_alternative<InvalidStorageFormatError>(error));
        REQUIRE_FALSE(storage.isConnected());
    }

    SECTION("Minor version beyond the integer range is invalid") {
        RouteDbFixture fixture;
        fixture.minor = 4294967296LL;
        test_utils::createRouteDb(dbFile, fixture);

        REQUIRE_FALSE(storage.start(error));
        REQUIRE(std::holds_alternative<InvalidStorageFormatError>(error));
    }

    SECTION("NULL compile time uses the exact file time") {
        RouteDbFixture fixture;
        fixture.compile_time = std::nullopt;
        test_utils::createRouteDb(dbFile, fixture);
        fs::last_write_time(dbFile, fs::file_time_type::clock::from_sys(utc(2022, 5, 6, 7, 8, 9)));

        REQUIRE(storage.start(error));
        REQUIRE(storage.creationDate() == utc(2022, 5, 6, 7, 8, 9));
    }

    SECTION("Newer major version is incompatible") {
        RouteDbFixture fixture;
        fixture.major = 2;
        test_utils::createRouteDb(dbFile, fixture);

        REQUIRE_FALSE(storage.start(error));
        REQUIRE(std::holds_alternative<IncompatibleStorageError>(error));
        const auto& incompatible = std::get<IncompatibleStorageError>(error);
        REQUIRE(incompatible.foundVersion == Version(2, 0));
        REQUIRE(incompatible.requiredVersion == Version(1, 0));
        REQUIRE_FALSE(storage.isConnected());
    }

    SECTION("Newer minor version is incompatible") {
        RouteDbFixture fixture;
        fixture.minor = 1;
        test_utils::createRouteDb(dbFile, fixture);

        REQUIRE_FALSE(storage.start(error));
        REQUIRE(std::holds_alternative<IncompatibleStorageError>(error));
    }

    SECTION("Valid database connects") {
        test_utils::createRouteDb(dbFile);

        REQUIRE(storage.start(error));
        REQUIRE(storage.isConnected());
        REQUIRE(storage.creationDate() == utc(2024, 3, 1, 10, 0, 0));

        // Starting twice keeps the connection
        REQUIRE(storage.start(error));
        REQUIRE(storage.isConnected());
    }

    SECTION("Older minor version is accepted") {
        RouteDbStorage newer(tmp.path(), Version(1, 3));
        RouteDbFixture fixture;
        fixture.minor = 2;
        test_utils::createRouteDb(dbFile, fixture);

        REQUIRE(newer.start(error));
        REQUIRE(newer.isConnected());
    }

    SECTION("Creation date falls back to the file time") {
        RouteDbFixture fixture;
        fixture.with_compile_time_column = false;
        test_utils::createRouteDb(dbFile, fixture);

        const auto before = system_clock::now() - minutes{5};
        REQUIRE(storage.start(error));
        const auto created = storage.creationDate();
        REQUIRE(created > before);
        REQUIRE(created < system_clock::now() + minutes{5});
    }

    SECTION("Unparsable compile time falls back to the file time") {
        RouteDbFixture fixture;
        fixture.compile_time = "last tuesday";
        test_utils::createRouteDb(dbFile, fixture);

        REQUIRE(storage.start(error));
        REQUIRE(storage.creationDate() > system_clock::now() - minutes{5});
    }
}

TEST_CASE("Route database stop", "[routedb][storage]") {
    ScopedTempDir tmp;
    test_utils::createRouteDb(tmp.path() / "peaks.sqlite");
    RouteDbStorage storage(tmp.path());
    StorageStartingError error;

    // Stopping a disconnected storage is harmless
    storage.stop();
    REQUIRE_FALSE(storage.isConnected());

    REQUIRE(storage.start(error));
    storage.stop();
    REQUIRE_FALSE(storage.isConnected());
    storage.stop();
    REQUIRE_FALSE(storage.isConnected());

    REQUIRE_THROWS_AS(storage.creationDate(), std::logic_error);

    // Reconnect after stop
    REQUIRE(storage.start(error));
    REQUIRE(storage.isConnected());
}

TEST_CASE("Route database import", "[routedb][storage]") {
    ScopedTempDir tmp;
    const fs::path dataDir = tmp.path() / "data";
    const fs::path dbFile = dataDir / "peaks.sqlite";
    RouteDbStorage storage(dataDir);
    ImportError importError;
    StorageStartingError startError;

    SECTION("Missing source") {
        REQUIRE_FALSE(storage.importFile((tmp.path() / "nothing.sqlite").string(), importError));
        REQUIRE(importError.kind == ImportError::Kind::SourceNotFound);
        REQUIRE_FALSE(fs::exists(dbFile));
    }

    SECTION("Directory as source") {
        REQUIRE_FALSE(storage.importFile(tmp.path().string(), importError));
        REQUIRE(importError.kind == ImportError::Kind::SourceNotFound);
    }

    SECTION("Copy creates the data directory and an exact copy") {
        const fs::path source = tmp.path() / "download" / "new.sqlite";
        test_utils::createRouteDb(source);

        REQUIRE(storage.importFile(source.string(), importError));
        REQUIRE(fs::exists(dbFile));
        REQUIRE(test_utils::readFile(dbFile) == test_utils::readFile(source));
        REQUIRE_FALSE(fs::exists(dataDir / "peaks.sqlite.import"));
        REQUIRE(fs::exists(source));

        REQUIRE(storage.start(startError));
    }

    SECTION("Existing database is replaced") {
        RouteDbFixture oldFixture;
        oldFixture.compile_time = "2020-01-01T00:00:00Z";
        test_utils::createRouteDb(dbFile, oldFixture);

        const fs::path source = tmp.path() / "new.sqlite";
        RouteDbFixture newFixture;
        newFixture.compile_time = "2025-01-01T00:00:00Z";
        test_utils::createRouteDb(source, newFixture);

        REQUIRE(storage.importFile(source.string(), importError));
        REQUIRE(storage.start(startError));
        REQUIRE(storage.creationDate() == utc(2025, 1, 1));
    }

    SECTION("Failed copy leaves the existing database untouched") {
        RouteDbFixture oldFixture;
        oldFixture.compile_time = "2020-01-01T00:00:00Z";
        test_utils::createRouteDb(dbFile, oldFixture);
        const std::string before = test_utils::readFile(dbFile);

        // A non-empty directory in place of the temporary copy makes the copy fail
        const fs::path blocker = dataDir / "peaks.sqlite.import";
        fs::create_directories(blocker);
        test_utils::writeFile(blocker / "occupied", "x");

        const fs::path source = tmp.path() / "new.sqlite";
        RouteDbFixture newFixture;
        newFixture.compile_time = "2025-01-01T00:00:00Z";
        test_utils::createRouteDb(source, newFixture);

        REQUIRE_FALSE(storage.importFile(source.string(), importError));
        REQUIRE(importError.kind == ImportError::Kind::CopyFailed);
        REQUIRE(test_utils::readFile(dbFile) == before);

        REQUIRE(storage.start(startError));
        REQUIRE(storage.creationDate() == utc(2020, 1, 1));
    }

    SECTION("Content is not validated") {
        const fs::path source = tmp.path() / "garbage.bin";
        test_utils::writeFile(source, std::string(2048, '?'));

        REQUIRE(storage.importFile(source.string(), importError));
        REQUIRE_FALSE(storage.start(startError));
    }

    SECTION("Import while connected is a programming error") {
        test_utils::createRouteDb(dbFile);
        REQUIRE(storage.start(startError));

        const fs::path source = tmp.path() / "new.sqlite";
        test_utils::createRouteDb(source);
        REQUIRE_THROWS_AS(storage.importFile(source.string(), importError), std::logic_error);
        REQUIRE(storage.isConnected());
    }
}

TEST_CASE("Route database queries", "[routedb][storage]") {
    ScopedTempDir tmp;
    test_utils::createRouteDb(tmp.path() / "peaks.sqlite");
    RouteDbStorage storage(tmp.path());

    SECTION("Queries need a connection") {
        REQUIRE_THROWS_AS(storage.retrieveSummits(), std::logic_error);
        REQUIRE_THROWS_AS(storage.retrieveSummit(1), std::logic_error);
        REQUIRE_THROWS_AS(storage.retrieveRoutesOfSummit(2, RoutesSortMode::Name), std::logic_error);
        REQUIRE_THROWS_AS(storage.retrieveRoute(10), std::logic_error);
        REQUIRE_THROWS_AS(storage.retrievePostsOfRoute(10, PostsSortMode::NewestFirst), std::logic_error);
    }

    StorageStartingError error;
    REQUIRE(storage.start(error));

    SECTION("Summits sorted by name") {
        auto summits = storage.retrieveSummits();
        REQUIRE(summits.size() == 3);
        REQUIRE(summits[0].name == "Falkenstein");
        REQUIRE(summits[1].name == "Kleiner Falke");
        REQUIRE(summits[2].name == "Zwillingsturm");
        REQUIRE(summits[2].id == 1);
    }

    SECTION("Summit name filter") {
        auto summits = storage.retrieveSummits(std::string("falk"));
        REQUIRE(summits.size() == 2);
        REQUIRE(summits[0].id == 2);
        REQUIRE(summits[1].id == 3);

        REQUIRE(storage.retrieveSummits(std::string("Matterhorn")).empty());
    }

    SECTION("Single summit") {
        REQUIRE(storage.retrieveSummit(3).name == "Kleiner Falke");
        REQUIRE_THROWS_AS(storage.retrieveSummit(99), std::out_of_range);
    }

    SECTION("Routes sorted by name") {
        auto routes = storage.retrieveRoutesOfSummit(2, RoutesSortMode::Name);
        REQUIRE(routes.size() == 3);
        REQUIRE(routes[0].name == "Alter Weg");
        REQUIRE(routes[1].name == "Direkte");
        REQUIRE(routes[2].name == "Westkante");
    }

    SECTION("Routes sorted by rating") {
        auto routes = storage.retrieveRoutesOfSummit(2, RoutesSortMode::Rating);
        REQUIRE(routes.size() == 3);
        REQUIRE(routes[0].id == 10);
        REQUIRE(routes[0].rating.has_value());
        REQUIRE_THAT(*routes[0].rating, Catch::Matchers::WithinAbs(2.5, 1e-9));
        REQUIRE(routes[1].id == 11);
        REQUIRE_THAT(*routes[1].rating, Catch::Matchers::WithinAbs(1.0, 1e-9));
        // Unrated routes come last
        REQUIRE(routes[2].id == 12);
        REQUIRE_FALSE(routes[2].rating.has_value());
    }

    SECTION("Summit without routes") {
        REQUIRE(storage.retrieveRoutesOfSummit(1, RoutesSortMode::Grade).empty());
    }

    SECTION("Single route") {
        auto route = storage.retrieveRoute(10);
        REQUIRE(route.name == "Westkante");
        REQUIRE(route.grade == "VIIa");
        REQUIRE_THROWS_AS(storage.retrieveRoute(404), std::out_of_range);
    }

    SECTION("Posts in both orders") {
        auto newest = storage.retrievePostsOfRoute(10, PostsSortMode::NewestFirst);
        REQUIRE(newest.size() == 2);
        REQUIRE(newest[0].userName == "ben");
        REQUIRE(newest[0].postDate == utc(2023, 7, 15, 8, 30, 0));
        REQUIRE(newest[0].rating == 2);
        REQUIRE(newest[1].userName == "anna");

        auto oldest = storage.retrievePostsOfRoute(10, PostsSortMode::OldestFirst);
        REQUIRE(oldest.size() == 2);
        REQUIRE(oldest[0].userName == "anna");
        REQUIRE(oldest[0].comment == "Great");

        REQUIRE(storage.retrievePostsOfRoute(12, PostsSortMode::NewestFirst).empty());
    }
}
