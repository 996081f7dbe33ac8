#include "LogManager.hpp"
#include "ErrorReporter.hpp"

#include <filesystem>
#include <fstream>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>

namespace utils
{

bool LogManager::s_initialized = false;
plog::Severity LogManager::s_level = plog::info;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(const LoggerConfig& config)
{
    if (s_initialized)
        return true;

    // plog cannot detach appenders, so a logger that was shut down is only re-enabled
    if (!s_appenders.empty())
    {
        SetLogLevel(config.level);
        s_initialized = true;
        return true;
    }

    try
    {
        PrepareLogDirectory(config.filepath);

        if (!config.append)
        {
            std::ofstream(config.filepath, std::ios::trunc).close();
        }

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            config.filepath.c_str(), config.max_file_size, static_cast<int>(config.backup_count));

        auto& logger = plog::init(config.level, file_appender.get());
        s_appenders.push_back(std::move(file_appender));

        if (config.add_console_appender)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>();
            logger.addAppender(console_appender.get());
            s_appenders.push_back(std::move(console_appender));
        }

        s_level = config.level;
        s_initialized = true;
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to initialize logging: " + config.filepath,
                                   ex.what());
        return false;
    }
}

void LogManager::Shutdown()
{
    if (auto logger = plog::get())
    {
        logger->setMaxSeverity(plog::none);
    }
    s_initialized = false;
}

bool LogManager::IsInitialized() { return s_initialized; }

plog::Severity LogManager::GetLogLevel() { return s_level; }

void LogManager::SetLogLevel(plog::Severity level)
{
    s_level = level;
    if (auto logger = plog::get())
    {
        logger->setMaxSeverity(level);
    }
}

void LogManager::PrepareLogDirectory(const std::string& filepath)
{
    const auto dir = std::filesystem::path(filepath).parent_path();
    if (dir.empty())
        return;

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to prepare log directory", ec.message());
    }
}

} // namespace utils
