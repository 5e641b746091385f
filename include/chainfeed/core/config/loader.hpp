#pragma once
#include <chainfeed/core/config/app_config.hpp>
#include <stdexcept>
#include <string>

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

class ConfigLoader {
public:
    /**
     * @throws ConfigError if the file is missing, unparsable, lacks a required
     *         field, or holds a field of the wrong type or an out-of-range value
     */
    static AppConfig::AppConfiguration loadConfig(const std::string& filepath);

    /**
     * Replace the endpoint and narrow the topic list to one topic, from the
     * command line. Empty strings leave the loaded value in place.
     * @throws ConfigError on a malformed endpoint or topic name
     */
    static void applyOverrides(AppConfig::AppConfiguration& config, const std::string& endpoint,
                               const std::string& topic);
};
