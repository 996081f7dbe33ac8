#include "Application.hpp"
#include "ConsoleStatusSink.hpp"
#include "config/ConfigManager.hpp"
#include "routedb/RouteDbStorage.hpp"
#include "updater/RouteDbInstaller.hpp"
#include "updater/RouteDbUpdateSource.hpp"
#include "usecases/RouteDbUpdateService.hpp"
#include "usecases/RouteDbUseCases.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/HttpCommon.hpp"
#include "utils/LogManager.hpp"

#include <plog/Log.h>

#include <cstring>
#include <iostream>
#include <optional>
#include <stdexcept>

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

Application::~Application() { cleanup(); }

int Application::run()
{
    if (!parseCommandLineArgs())
    {
        printUsage();
        return kExitUsage;
    }

    config_ = std::make_unique<config::ConfigManager>(config_path_);
    // Parse errors are queued in ErrorReporter and printed below
    config_->load();

    if (!initializeLogging())
    {
        printPendingErrors();
        return kExitInactive;
    }

    PLOG_INFO << "trad-routedb " << command_ << " (config: " << config_path_ << ")";
    setupManagers();

    int exitCode = kExitUsage;
    try
    {
        if (command_ == "status")
            exitCode = runStatus();
        else if (command_ == "update")
            exitCode = runUpdate();
        else if (command_ == "import")
            exitCode = runImport();
        else if (command_ == "summits")
            exitCode = runSummits();
    }
    catch (const std::exception& e)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::RouteDb, "Command '" + command_ + "' failed", e.what());
        exitCode = kExitInactive;
    }

    printPendingErrors();
    return exitCode;
}

bool Application::parseCommandLineArgs()
{
    for (int i = 1; i < argc_; ++i)
    {
        const char* arg = argv_[i];
        if (std::strcmp(arg, "--config") == 0)
        {
            if (i + 1 >= argc_)
            {
                std::cerr << "--config requires a file name" << std::endl;
                return false;
            }
            config_path_ = argv_[++i];
        }
        else if (std::strcmp(arg, "--verbose") == 0 || std::strcmp(arg, "-v") == 0)
        {
            verbose_ = true;
        }
        else if (command_.empty())
        {
            command_ = arg;
        }
        else
        {
            command_args_.emplace_back(arg);
        }
    }

    if (command_ == "status" || command_ == "update")
        return command_args_.empty();
    if (command_ == "import")
        return command_args_.size() == 1;
    if (command_ == "summits")
        return command_args_.size() <= 1;

    if (!command_.empty())
    {
        std::cerr << "Unknown command: " << command_ << std::endl;
    }
    return false;
}

bool Application::initializeLogging()
{
    const auto& logging = config_->logging();

    utils::LogManager::LoggerConfig logger;
    logger.filepath = logging.file;
    logger.level = verbose_ ? plog::debug : static_cast<plog::Severity>(logging.level);
    logger.append = logging.append_logs;
    logger.add_console_appender = logging.console || verbose_;
    return utils::LogManager::Initialize(logger);
}

void Application::setupManagers()
{
    const auto& routeDb = config_->routeDb();
    const auto& ota = config_->ota();

    utils::SessionConfig session;
    session.connect_timeout_ms = ota.connect_timeout_ms;
    session.timeout_ms = ota.timeout_ms;
    http_ = std::make_unique<utils::HttpClient>(session);

    storage_ = std::make_unique<routedb::RouteDbStorage>(routeDb.data_dir, routeDb.supported_schema);

    updater::OtaSettings settings;
    settings.baseUrl = ota.base_url;
    settings.apiEndpoint = ota.api_endpoint;
    settings.tempRoot = routeDb.temp_dir;
    update_source_ = std::make_unique<updater::RouteDbUpdateSource>(*http_, settings, routeDb.supported_schema);

    status_sink_ = std::make_unique<ConsoleStatusSink>();
    installer_ = std::make_unique<updater::RouteDbInstaller>(*storage_, *update_source_, *status_sink_);
    use_cases_ = std::make_unique<usecases::RouteDbUseCases>(*installer_);
    update_service_ = std::make_unique<usecases::RouteDbUpdateService>(*use_cases_);
}

int Application::runStatus() { return use_cases_->startRouteDb() ? kExitActive : kExitInactive; }

int Application::runUpdate()
{
    use_cases_->startRouteDb();

    bool attempted = false;
    if (!update_service_->updateRouteDatabaseAsync([&attempted](bool result) { attempted = result; }))
    {
        return kExitInactive;
    }
    update_service_->wait();

    if (!attempted)
    {
        std::cout << "No route database update available" << std::endl;
    }
    return storage_->isConnected() ? kExitActive : kExitInactive;
}

int Application::runImport()
{
    bool activated = false;
    if (!update_service_->importRouteDbFileAsync(command_args_.front(), [&activated](bool result) { activated = result; }))
    {
        return kExitInactive;
    }
    update_service_->wait();
    return activated ? kExitActive : kExitInactive;
}

int Application::runSummits()
{
    if (!use_cases_->startRouteDb())
    {
        return kExitInactive;
    }

    std::optional<std::string> filter;
    if (!command_args_.empty())
    {
        filter = command_args_.front();
    }

    for (const auto& summit : storage_->retrieveSummits(filter))
    {
        std::cout << summit.id << '\t' << summit.name << '\n';
    }
    std::cout.flush();
    return kExitActive;
}

void Application::printUsage() const
{
    std::cerr << "Usage: trad-routedb [--config <file>] [--verbose] <command>\n"
              << "Commands:\n"
              << "  status             Show the state of the installed route database\n"
              << "  update             Download a newer route database if one is available\n"
              << "  import <file>      Install a route database file\n"
              << "  summits [filter]   List the summits of the route database\n";
}

void Application::printPendingErrors() const
{
    for (const auto& report : utils::ErrorReporter::GetPendingErrors())
    {
        std::cerr << utils::ErrorReporter::SeverityToString(report.severity) << ": " << report.user_message;
        if (!report.technical_details.empty())
        {
            std::cerr << " (" << report.technical_details << ")";
        }
        std::cerr << std::endl;
    }
}

void Application::cleanup()
{
    // Join the worker before the objects it uses go away
    update_service_.reset();
    use_cases_.reset();
    installer_.reset();
    if (storage_)
    {
        storage_->stop();
    }
    utils::LogManager::Shutdown();
}
