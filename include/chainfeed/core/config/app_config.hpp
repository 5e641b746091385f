#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace AppConfig {

struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
};

struct TopicConfig {
    std::string name;
    std::string render = "hex";     // hex | raw | utf8
};

struct SubscriberConfig {
    std::string endpoint;
    uint32_t receive_timeout_ms = 100;
    int receive_hwm = 1000;
    bool tcp_keepalive = true;
    std::vector<TopicConfig> topics;
};

struct DecoderConfig {
    uint32_t max_topic_length = 32;
};

struct GapDetectionConfig {
    bool enabled = true;
    bool allow_wraparound = true;
    bool reset_on_reconnect = true;
};

struct DeadLetterConfig {
    uint32_t capacity = 100;
};

struct AppConfiguration {
    std::string app_name;
    std::string version;
    LoggingConfig logging;
    SubscriberConfig subscriber;
    DecoderConfig decoder;
    GapDetectionConfig gap_detection;
    DeadLetterConfig dead_letter;
};

} // namespace AppConfig
