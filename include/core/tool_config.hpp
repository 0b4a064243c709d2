#ifndef TOOL_CONFIG_HPP
#define TOOL_CONFIG_HPP

#include <string>
#include <nlohmann/json.hpp>

/**
 * Runtime settings, read from config/tool_config.json. Every key is optional;
 * missing keys keep the defaults below.
 */
struct ToolConfig {
    std::string baseUrl{"https://api.warframe.market/v1"};
    int requestLimit{3};      // requests admitted per window
    int windowMs{1000};
    int backoffMs{1000};      // sleep before retrying a rate-limited fetch
    int defaultCount{5};      // floor prices reported per item
    long timeoutSeconds{3};
    int workerThreads{4};
    bool verbose{false};
    std::string userAgent{"market_floor/1.0"};
};

ToolConfig toolConfigFromJson(const nlohmann::json& j);

// falls back to defaults (with a warning) when the file is missing or invalid
ToolConfig loadToolConfig(const std::string& path);

#endif // TOOL_CONFIG_HPP
