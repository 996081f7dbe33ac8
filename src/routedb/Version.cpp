#include "Version.hpp"

#include <regex>
#include <sstream>

namespace routedb
{

Version::Version(int major, int minor) : major_(major), minor_(minor)
{
    if (major < 0)
    {
        throw ValidationError("Major version parts must not be negative values: " + std::to_string(major));
    }
    if (minor < 0)
    {
        throw ValidationError("Minor version parts must not be negative values: " + std::to_string(minor));
    }
    if (minor >= kMinorLimit)
    {
        throw ValidationError("Minor version parts must be smaller than " + std::to_string(kMinorLimit) + ": " +
                              std::to_string(minor));
    }
}

bool Version::accepts(const Version& other) const
{
    return major_ == other.major_ && minor_ >= other.minor_;
}

std::string Version::toString() const
{
    std::ostringstream oss;
    oss << major_ << "." << minor_;
    return oss.str();
}

bool Version::tryParse(const std::string& versionString, Version& outVersion)
{
    std::string cleaned = versionString;
    if (!cleaned.empty() && (cleaned[0] == 'v' || cleaned[0] == 'V'))
    {
        cleaned = cleaned.substr(1);
    }

    std::regex versionRegex(R"(^(\d+)\.(\d+)$)");
    std::smatch match;
    if (!std::regex_match(cleaned, match, versionRegex))
    {
        return false;
    }

    try
    {
        outVersion = Version(std::stoi(match[1].str()), std::stoi(match[2].str()));
        return true;
    }
    catch (const std::exception&)
    {
        // out of int range or above the minor limit
        return false;
    }
}

} // namespace routedb
