#pragma once

#include <memory>
#include <string>
#include <vector>

namespace config
{
class ConfigManager;
}

namespace routedb
{
class RouteDbStorage;
}

namespace utils
{
class HttpClient;
}

namespace updater
{
class RouteDbUpdateSource;
class RouteDbInstaller;
} // namespace updater

namespace usecases
{
class RouteDbUseCases;
class RouteDbUpdateService;
} // namespace usecases

class ConsoleStatusSink;

// Command line front end: trad-routedb [--config <file>] [--verbose] <command> [args]
class Application
{
public:
    Application(int argc, char** argv);
    ~Application();

    // Returns the process exit code
    int run();

    static constexpr int kExitActive = 0;
    static constexpr int kExitInactive = 1;
    static constexpr int kExitUsage = 2;

private:
    bool parseCommandLineArgs();
    bool initializeLogging();
    void setupManagers();

    int runStatus();
    int runUpdate();
    int runImport();
    int runSummits();

    void printUsage() const;
    void printPendingErrors() const;
    void cleanup();

    std::unique_ptr<config::ConfigManager> config_;
    std::unique_ptr<utils::HttpClient> http_;
    std::unique_ptr<routedb::RouteDbStorage> storage_;
    std::unique_ptr<updater::RouteDbUpdateSource> update_source_;
    std::unique_ptr<ConsoleStatusSink> status_sink_;
    std::unique_ptr<updater::RouteDbInstaller> installer_;
    std::unique_ptr<usecases::RouteDbUseCases> use_cases_;
    std::unique_ptr<usecases::RouteDbUpdateService> update_service_;

    std::string config_path_ = "config.toml";
    bool verbose_ = false;
    std::string command_;
    std::vector<std::string> command_args_;

    int argc_ = 0;
    char** argv_ = nullptr;
};
