#pragma once

#include <filesystem>
#include <string>

namespace utils
{

// Create a new, uniquely named directory "<prefix>XXXXXX" inside base (base is created if
// needed). Throws std::system_error on failure. The caller owns the directory.
std::filesystem::path createTempDirectory(const std::filesystem::path& base, const std::string& prefix);

} // namespace utils
