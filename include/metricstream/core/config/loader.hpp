#pragma once

#include <metricstream/core/config/app_config.hpp>
#include <string>

class ConfigLoader {
public:
    /**
     * @brief Load and validate a YAML configuration file
     * @throws std::runtime_error on a missing file, missing or mistyped field,
     *         or a value that fails validation
     */
    static AppConfig::AppConfiguration loadConfig(const std::string& path);

    // "<integer><unit>", unit in {ms, s, m, h}
    static MetricStream::Millis parseDuration(const std::string& text);
};
