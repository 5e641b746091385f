#pragma once
#include <chainfeed/core/notify/payload_renderer.hpp>
#include <string>
#include <unordered_map>
#include <shared_mutex>
#include <vector>

namespace ChainFeed {

struct TopicSetting {
    std::string name;
    RenderMode render = RenderMode::HEX;
};

class TopicTable {
public:
    explicit TopicTable(RenderMode default_mode = RenderMode::HEX) : default_mode_(default_mode) {}

    void Load(const std::vector<TopicSetting>& topics);
    bool FoundTopic(const std::string& topic, RenderMode& mode) const;

    // Configured mode, or the default for unknown topics
    RenderMode modeFor(const std::string& topic) const;
    size_t size() const;

private:
    mutable std::shared_mutex share_mutex;
    std::unordered_map<std::string, RenderMode> Table;
    RenderMode default_mode_;
};

} // namespace ChainFeed
