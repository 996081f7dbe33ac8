#include "TempDirectory.hpp"

#include <system_error>

#ifdef _WIN32
#include <rpc.h>
#else
#include <cerrno>
#include <cstdlib>

#include <unistd.h>
#endif

namespace utils
{

#ifdef _WIN32

std::filesystem::path createTempDirectory(const std::filesystem::path& base, const std::string& prefix)
{
    std::filesystem::create_directories(base);

    ::UUID uuid;
    auto status = ::UuidCreate(&uuid);
    if (status != RPC_S_OK && status != RPC_S_UUID_LOCAL_ONLY && status != RPC_S_UUID_NO_ADDRESS)
    {
        throw std::system_error(std::error_code(static_cast<int>(status), std::system_category()),
                                "Failed to generate a temporary directory name");
    }

    RPC_CSTR uuid_str = nullptr;
    status = ::UuidToStringA(&uuid, &uuid_str);
    if (status != RPC_S_OK)
    {
        throw std::system_error(std::error_code(static_cast<int>(status), std::system_category()),
                                "Failed to generate a temporary directory name");
    }
    std::string uuid_std_str(reinterpret_cast<const char*>(uuid_str));
    ::RpcStringFreeA(&uuid_str);

    auto new_dir = base / (prefix + uuid_std_str);
    // create_directory() reports an existing directory as false, which must not be reused
    if (!std::filesystem::create_directory(new_dir))
    {
        throw std::system_error(std::make_error_code(std::errc::file_exists),
                                "Temporary directory already exists: " + new_dir.string());
    }
    return new_dir;
}

#else

std::filesystem::path createTempDirectory(const std::filesystem::path& base, const std::string& prefix)
{
    std::filesystem::create_directories(base);

    auto templ = (base / (prefix + "XXXXXX")).string();
    const char* tempdir_path = ::mkdtemp(templ.data());
    if (tempdir_path == nullptr)
    {
        throw std::system_error(std::error_code(errno, std::system_category()),
                                "Failed to create a temporary directory in " + base.string());
    }
    return std::filesystem::path(tempdir_path);
}

#endif

} // namespace utils
