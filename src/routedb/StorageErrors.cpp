#include "StorageErrors.hpp"

#include <type_traits>

namespace routedb
{

std::string describe(const StorageStartingError& error)
{
    return std::visit(
        [](const auto& e) -> std::string
        {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, InaccessibleStorageError>)
            {
                return "Inaccessible storage: " + e.cause + " (" + e.path + ")";
            }
            else if constexpr (std::is_same_v<T, InvalidStorageFormatError>)
            {
                return "Invalid storage format: " + e.reason + " (" + e.path + ")";
            }
            else
            {
                static_assert(std::is_same_v<T, IncompatibleStorageError>);
                return "Incompatible storage: found schema " + e.foundVersion.toString() + ", requires " +
                       e.requiredVersion.toString() + " (" + e.path + ")";
            }
        },
        error);
}

std::string describe(const ImportError& error)
{
    switch (error.kind)
    {
    case ImportError::Kind::SourceNotFound:
        return "Import source not found: " + error.path + (error.message.empty() ? "" : " (" + error.message + ")");
    case ImportError::Kind::CopyFailed:
        return "Import copy failed: " + error.path + (error.message.empty() ? "" : " (" + error.message + ")");
    }
    return "Import failed: " + error.path;
}

} // namespace routedb
