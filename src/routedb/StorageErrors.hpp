#pragma once

#include "Version.hpp"

#include <string>
#include <variant>

namespace routedb
{

// The database file cannot be opened (missing, permission denied, not an SQLite file, ...)
struct InaccessibleStorageError
{
    std::string path;
    std::string cause;
};

// The file opens but lacks the expected metadata shape
struct InvalidStorageFormatError
{
    std::string path;
    std::string reason;
};

// The metadata is present but its schema version is not accepted by this application
struct IncompatibleStorageError
{
    std::string path;
    Version foundVersion{ 0, 0 };
    Version requiredVersion{ 0, 0 };
};

// Everything that can go wrong while starting the route database storage
using StorageStartingError =
    std::variant<InaccessibleStorageError, InvalidStorageFormatError, IncompatibleStorageError>;

// Failure of replacing the route database file
struct ImportError
{
    enum class Kind
    {
        SourceNotFound, // Given path does not exist or is not a regular file
        CopyFailed // Copy or rename failed, the previous database file is unchanged
    };

    Kind kind = Kind::CopyFailed;
    std::string path;
    std::string message;
};

// Human-readable description for logs (not meant for end users)
std::string describe(const StorageStartingError& error);
std::string describe(const ImportError& error);

} // namespace routedb
