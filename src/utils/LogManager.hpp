#pragma once

#include <string>
#include <vector>
#include <memory>
#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

class LogManager
{
public:
    struct LoggerConfig
    {
        std::string filepath = "logs/routedb.log";
        plog::Severity level = plog::info;
        bool append = true;
        size_t max_file_size = 10 * 1024 * 1024;
        size_t backup_count = 3;
        bool add_console_appender = false;
    };

    // Install the default plog logger. Calling it again while initialized does nothing.
    // After Shutdown() the existing appenders are re-enabled with the new level.
    static bool Initialize(const LoggerConfig& config);

    static void Shutdown();

    static bool IsInitialized();
    static plog::Severity GetLogLevel();

    // Raise or lower the severity of the default logger at runtime
    static void SetLogLevel(plog::Severity level);

private:
    LogManager() = default;

    static void PrepareLogDirectory(const std::string& filepath);

    static bool s_initialized;
    static plog::Severity s_level;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
