#include "core/tool_config.hpp"
#include <fstream>
#include <iostream>

using json = nlohmann::json;

// Keeps `current` when the configured value is below `minimum`.
static int atLeast(const char* key, int value, int minimum, int current) {
    if (value < minimum) {
        std::cerr << "[CONFIG] " << key << "=" << value
                  << " is below " << minimum << ", keeping " << current << "\n";
        return current;
    }
    return value;
}

ToolConfig toolConfigFromJson(const json& j) {
    ToolConfig cfg;
    if (!j.is_object()) {
        return cfg;
    }

    cfg.baseUrl        = j.value("baseUrl", cfg.baseUrl);
    cfg.requestLimit   = atLeast("requestLimit", j.value("requestLimit", cfg.requestLimit), 1, cfg.requestLimit);
    cfg.windowMs       = atLeast("windowMs", j.value("windowMs", cfg.windowMs), 1, cfg.windowMs);
    cfg.backoffMs      = atLeast("backoffMs", j.value("backoffMs", cfg.backoffMs), 0, cfg.backoffMs);
    cfg.defaultCount   = atLeast("defaultCount", j.value("defaultCount", cfg.defaultCount), 0, cfg.defaultCount);
    cfg.workerThreads  = atLeast("workerThreads", j.value("workerThreads", cfg.workerThreads), 1, cfg.workerThreads);
    cfg.timeoutSeconds = j.value("timeoutSeconds", cfg.timeoutSeconds);
    cfg.verbose        = j.value("verbose", cfg.verbose);
    cfg.userAgent      = j.value("userAgent", cfg.userAgent);

    while (!cfg.baseUrl.empty() && cfg.baseUrl.back() == '/') {
        cfg.baseUrl.pop_back();
    }
    return cfg;
}

ToolConfig loadToolConfig(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::cerr << "[CONFIG] Could not open " << path
                  << ", using defaults.\n";
        return ToolConfig{};
    }

    json j;
    try {
        f >> j;
        return toolConfigFromJson(j);
    } catch (const json::exception& e) {
        std::cerr << "[CONFIG] Invalid config " << path << " (" << e.what()
                  << "), using defaults.\n";
    }
    return ToolConfig{};
}
