#pragma once

#include "Version.hpp"

// Table and column names of the route database. Always refer to these constants so that
// schema changes stay in one place.
namespace routedb::schema
{

// The schema version this application was written for
inline Version supportedVersion() { return Version(1, 0); }

// File name of the route database within the application data directory
inline constexpr const char* kDatabaseFileName = "peaks.sqlite";

// Exactly one row, never changes
namespace metadata
{
inline constexpr const char* kTable = "database_metadata";
inline constexpr const char* kMajorVersion = "schema_version_major";
inline constexpr const char* kMinorVersion = "schema_version_minor";
inline constexpr const char* kCompileTime = "compile_time";
inline constexpr const char* kVendor = "vendor";
} // namespace metadata

namespace summits
{
inline constexpr const char* kTable = "summits";
inline constexpr const char* kId = "summits.id";
inline constexpr const char* kName = "summits.summit_name";
} // namespace summits

namespace routes
{
inline constexpr const char* kTable = "routes";
inline constexpr const char* kId = "routes.id";
inline constexpr const char* kSummitId = "routes.summit_id";
inline constexpr const char* kName = "routes.route_name";
inline constexpr const char* kGrade = "routes.route_grade";
} // namespace routes

namespace posts
{
inline constexpr const char* kTable = "posts";
inline constexpr const char* kId = "posts.id";
inline constexpr const char* kRouteId = "posts.route_id";
inline constexpr const char* kUserName = "posts.user_name";
inline constexpr const char* kPostDate = "posts.post_date";
inline constexpr const char* kComment = "posts.comment";
inline constexpr const char* kRating = "posts.rating";
} // namespace posts

} // namespace routedb::schema
