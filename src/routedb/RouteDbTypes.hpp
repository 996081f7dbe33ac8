#pragma once

#include "utils/TimeUtils.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace routedb
{

struct Summit
{
    std::int64_t id = 0;
    std::string name;
};

struct Route
{
    std::int64_t id = 0;
    std::string name;
    std::string grade;
    std::optional<double> rating; // Average post rating, empty without posts
};

struct Post
{
    std::string userName;
    utils::Timestamp postDate;
    std::string comment;
    int rating = 0;
};

enum class RoutesSortMode
{
    Name, // Ascending
    Grade, // Ascending
    Rating // Best rated first
};

enum class PostsSortMode
{
    NewestFirst,
    OldestFirst
};

} // namespace routedb
