#pragma once

#include <compare>
#include <stdexcept>
#include <string>

namespace routedb
{

// Thrown when a Version is constructed from invalid components
class ValidationError : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

// Two-component semantic version (major.minor), used for route database schemas.
// Older versions compare smaller than newer ones.
class Version
{
public:
    // Minor components must stay below this limit (keeps hashKey() collision-free)
    static constexpr int kMinorLimit = 1000;

    // Throws ValidationError for negative components or minor >= kMinorLimit
    Version(int major, int minor);

    int major() const { return major_; }

    int minor() const { return minor_; }

    // True if data of version `other` can be used by something supporting this version:
    // same major and other.minor <= minor(). Not symmetric.
    bool accepts(const Version& other) const;

    // Stable lookup key, unique for every valid version
    int hashKey() const { return major_ * kMinorLimit + minor_; }

    // "major.minor"
    std::string toString() const;

    auto operator<=>(const Version& other) const = default;

    // Parse "1.2" or "v1.2" (returns true if valid)
    static bool tryParse(const std::string& versionString, Version& outVersion);

private:
    int major_;
    int minor_;
};

} // namespace routedb
