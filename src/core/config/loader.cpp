#include <chainfeed/core/config/loader.hpp>
#include <chainfeed/core/notify/payload_renderer.hpp>
#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cstdint>
#include <limits>

namespace {

YAML::Node requireNode(const YAML::Node& parent, const char* key, const std::string& path) {
    const YAML::Node node = parent[key];
    if (!node || node.IsNull()) {
        throw ConfigError("Missing required field: " + path + key);
    }
    return node;
}

template <typename T>
T readScalar(const YAML::Node& node, const std::string& field) {
    if (!node.IsScalar()) {
        throw ConfigError("Field " + field + " must be a scalar");
    }
    try {
        return node.as<T>();
    } catch (const YAML::BadConversion&) {
        throw ConfigError("Field " + field + " has an invalid type: '" + node.Scalar() + "'");
    }
}

template <typename T>
void readOptional(const YAML::Node& parent, const char* key, const std::string& path, T& out) {
    const YAML::Node node = parent[key];
    if (!node) return;
    out = readScalar<T>(node, path + key);
}

uint32_t readBoundedUint(const YAML::Node& parent, const char* key, const std::string& path,
                         int64_t min, int64_t max, uint32_t fallback) {
    const YAML::Node node = parent[key];
    if (!node) return fallback;
    int64_t v = readScalar<int64_t>(node, path + key);
    if (v < min || v > max) {
        throw ConfigError("Field " + path + key + " out of range [" + std::to_string(min) + ", " +
                          std::to_string(max) + "]: " + std::to_string(v));
    }
    return static_cast<uint32_t>(v);
}

void validateLogLevel(const std::string& level) {
    static const std::array<const char*, 7> kLevels = {
        "trace", "debug", "info", "warning", "error", "critical", "off"};
    bool known = std::any_of(kLevels.begin(), kLevels.end(),
                             [&](const char* l) { return level == l; });
    if (!known) {
        throw ConfigError("Invalid logging.level: '" + level + "'");
    }
}

void validateEndpoint(const std::string& endpoint, const std::string& field) {
    if (endpoint.find("://") == std::string::npos) {
        throw ConfigError("Invalid " + field + " (expected transport://address): '" + endpoint + "'");
    }
}

void validateTopicName(const std::string& name, uint32_t max_topic_length, const std::string& field) {
    bool printable = std::all_of(name.begin(), name.end(),
                                 [](char c) { return c >= 0x20 && c <= 0x7E; });
    if (name.empty() || name.size() > max_topic_length || !printable) {
        throw ConfigError("Invalid topic name '" + name + "' in " + field);
    }
}

AppConfig::SubscriberConfig parseSubscriber(const YAML::Node& node, uint32_t max_topic_length) {
    if (!node.IsMap()) {
        throw ConfigError("Field subscriber must be a map");
    }

    AppConfig::SubscriberConfig sub;
    sub.endpoint = readScalar<std::string>(requireNode(node, "endpoint", "subscriber."), "subscriber.endpoint");
    validateEndpoint(sub.endpoint, "subscriber.endpoint");

    sub.receive_timeout_ms = readBoundedUint(node, "receive_timeout_ms", "subscriber.", 1, 60000,
                                             sub.receive_timeout_ms);
    sub.receive_hwm = static_cast<int>(readBoundedUint(node, "receive_hwm", "subscriber.", 0,
                                                       std::numeric_limits<int>::max(),
                                                       static_cast<uint32_t>(sub.receive_hwm)));
    readOptional(node, "tcp_keepalive", "subscriber.", sub.tcp_keepalive);

    const YAML::Node topics = requireNode(node, "topics", "subscriber.");
    if (!topics.IsSequence() || topics.size() == 0) {
        throw ConfigError("Field subscriber.topics must be a non-empty list");
    }

    for (size_t i = 0; i < topics.size(); ++i) {
        const YAML::Node t = topics[i];
        const std::string path = "subscriber.topics[" + std::to_string(i) + "].";
        AppConfig::TopicConfig topic;
        if (t.IsScalar()) {
            topic.name = t.as<std::string>();
        } else if (t.IsMap()) {
            topic.name = readScalar<std::string>(requireNode(t, "name", path), path + "name");
            readOptional(t, "render", path, topic.render);
        } else {
            throw ConfigError("Field " + path.substr(0, path.size() - 1) + " must be a name or a map");
        }

        validateTopicName(topic.name, max_topic_length, path + "name");
        if (!ChainFeed::renderModeFromString(topic.render)) {
            throw ConfigError("Invalid render mode '" + topic.render + "' in " + path + "render");
        }
        sub.topics.push_back(std::move(topic));
    }
    return sub;
}

} // anonymous namespace

AppConfig::AppConfiguration ConfigLoader::loadConfig(const std::string& filepath) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(filepath);
    } catch (const YAML::BadFile&) {
        throw ConfigError("Cannot open config file: " + filepath);
    } catch (const YAML::ParserException& e) {
        throw ConfigError("Cannot parse config file " + filepath + ": " + e.what());
    }

    if (!root.IsMap()) {
        throw ConfigError("Config root must be a map: " + filepath);
    }

    AppConfig::AppConfiguration config;
    config.app_name = readScalar<std::string>(requireNode(root, "app_name", ""), "app_name");
    config.version = readScalar<std::string>(requireNode(root, "version", ""), "version");

    if (const YAML::Node logging = root["logging"]) {
        readOptional(logging, "level", "logging.", config.logging.level);
        readOptional(logging, "pattern", "logging.", config.logging.pattern);
    }
    validateLogLevel(config.logging.level);

    if (const YAML::Node decoder = root["decoder"]) {
        config.decoder.max_topic_length = readBoundedUint(decoder, "max_topic_length", "decoder.", 1, 255,
                                                          config.decoder.max_topic_length);
    }

    config.subscriber = parseSubscriber(requireNode(root, "subscriber", ""), config.decoder.max_topic_length);

    if (const YAML::Node gaps = root["gap_detection"]) {
        readOptional(gaps, "enabled", "gap_detection.", config.gap_detection.enabled);
        readOptional(gaps, "allow_wraparound", "gap_detection.", config.gap_detection.allow_wraparound);
        readOptional(gaps, "reset_on_reconnect", "gap_detection.", config.gap_detection.reset_on_reconnect);
    }

    if (const YAML::Node dlq = root["dead_letter"]) {
        config.dead_letter.capacity = readBoundedUint(dlq, "capacity", "dead_letter.", 0, 100000,
                                                      config.dead_letter.capacity);
    }

    spdlog::info("Loaded configuration '{}' v{} from {} ({} topics)", config.app_name, config.version,
                 filepath, config.subscriber.topics.size());
    return config;
}

void ConfigLoader::applyOverrides(AppConfig::AppConfiguration& config, const std::string& endpoint,
                                  const std::string& topic) {
    if (!endpoint.empty()) {
        validateEndpoint(endpoint, "endpoint override");
        config.subscriber.endpoint = endpoint;
    }
    if (!topic.empty()) {
        validateTopicName(topic, config.decoder.max_topic_length, "topic override");

        // A configured topic keeps its render mode
        AppConfig::TopicConfig selected;
        selected.name = topic;
        for (const auto& t : config.subscriber.topics) {
            if (t.name == topic) selected.render = t.render;
        }
        config.subscriber.topics = {selected};
    }
}
