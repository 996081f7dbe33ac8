#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <toml++/toml.h>
#include <plog/Log.h>
#include <fstream>

namespace config
{

ConfigManager::ConfigManager(std::string configPath)
    : config_path_(std::move(configPath))
{
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::load()
{
    last_error_.clear();
    routedb_ = RouteDbConfig();
    ota_ = OtaConfig();
    logging_ = LoggingConfig();

    std::ifstream ifs(config_path_, std::ios::binary);
    if (!ifs)
    {
        PLOG_INFO << "No configuration file at " << config_path_ << ", using defaults";
        return true;
    }

    try
    {
        const toml::table root = toml::parse(ifs, config_path_);
        loadRouteDb(root["routedb"]);
        loadOta(root["ota"]);
        loadLogging(root["logging"]);
        return true;
    }
    catch (const toml::parse_error& pe)
    {
        last_error_ = std::string("config parse error: ") + std::string(pe.description());
        PLOG_WARNING << last_error_;

        std::string error_details;
        if (pe.source().begin.line > 0)
        {
            error_details = "Error at line " + std::to_string(pe.source().begin.line) + ": " + std::string(pe.description());
        }
        else
        {
            error_details = std::string(pe.description());
        }

        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Configuration file has errors. Using defaults.",
                                            error_details + "\nFile: " + config_path_);
        return false;
    }
}

void ConfigManager::loadRouteDb(const toml::node_view<const toml::node>& section)
{
    if (auto v = section["data_dir"].value<std::string>())
        routedb_.data_dir = *v;
    if (auto v = section["temp_dir"].value<std::string>())
        routedb_.temp_dir = *v;

    if (auto v = section["supported_schema"].value<std::string>())
    {
        routedb::Version parsed{ 0, 0 };
        if (routedb::Version::tryParse(*v, parsed))
        {
            routedb_.supported_schema = parsed;
        }
        else
        {
            reportInvalid("routedb.supported_schema", "'" + *v + "' is not a major.minor version");
        }
    }
}

void ConfigManager::loadOta(const toml::node_view<const toml::node>& section)
{
    if (auto v = section["base_url"].value<std::string>())
        ota_.base_url = *v;
    if (auto v = section["api_endpoint"].value<std::string>())
        ota_.api_endpoint = *v;

    if (auto v = section["connect_timeout_ms"].value<int64_t>())
    {
        if (*v > 0)
            ota_.connect_timeout_ms = static_cast<int>(*v);
        else
            reportInvalid("ota.connect_timeout_ms", "must be positive");
    }
    if (auto v = section["timeout_ms"].value<int64_t>())
    {
        if (*v > 0)
            ota_.timeout_ms = static_cast<int>(*v);
        else
            reportInvalid("ota.timeout_ms", "must be positive");
    }
}

void ConfigManager::loadLogging(const toml::node_view<const toml::node>& section)
{
    if (auto v = section["file"].value<std::string>())
        logging_.file = *v;
    if (auto v = section["level"].value<int64_t>())
    {
        if (*v >= 0 && *v <= 6)
            logging_.level = static_cast<int>(*v);
        else
            reportInvalid("logging.level", "must be between 0 and 6");
    }
    if (auto v = section["append_logs"].value<bool>())
        logging_.append_logs = *v;
    if (auto v = section["console"].value<bool>())
        logging_.console = *v;
}

void ConfigManager::reportInvalid(const std::string& key, const std::string& details)
{
    last_error_ = "invalid value for " + key + ": " + details;
    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                        "Invalid configuration value ignored: " + key, details);
}

} // namespace config
