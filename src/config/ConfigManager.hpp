#pragma once

#include "routedb/Version.hpp"

#include <cstdint>
#include <string>

#include <toml++/toml.h>

namespace config
{

struct RouteDbConfig
{
    std::string data_dir = "data";
    std::string temp_dir; // empty: system temp directory
    routedb::Version supported_schema{ 1, 0 };
};

struct OtaConfig
{
    std::string base_url = "https://www.fomori.de/trad/ota/";
    std::string api_endpoint = "api.php";
    int connect_timeout_ms = 5000;
    int timeout_ms = 60000;
};

struct LoggingConfig
{
    std::string file = "logs/routedb.log";
    int level = 4; // plog::Severity, 0 (none) .. 6 (verbose)
    bool append_logs = true;
    bool console = false;
};

// Loads config.toml. Missing keys keep their defaults, invalid values are reported and ignored.
class ConfigManager
{
public:
    explicit ConfigManager(std::string configPath = "config.toml");
    ~ConfigManager();

    // A missing file is not an error. Returns false on a parse error (defaults stay in effect).
    bool load();

    const RouteDbConfig& routeDb() const { return routedb_; }
    const OtaConfig& ota() const { return ota_; }
    const LoggingConfig& logging() const { return logging_; }

    const std::string& configPath() const { return config_path_; }
    const char* lastError() const { return last_error_.c_str(); }

private:
    void loadRouteDb(const toml::node_view<const toml::node>& section);
    void loadOta(const toml::node_view<const toml::node>& section);
    void loadLogging(const toml::node_view<const toml::node>& section);
    void reportInvalid(const std::string& key, const std::string& details);

    std::string config_path_;
    std::string last_error_;

    RouteDbConfig routedb_;
    OtaConfig ota_;
    LoggingConfig logging_;
};

} // namespace config
