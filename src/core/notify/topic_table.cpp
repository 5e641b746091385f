#include <chainfeed/core/notify/topic_table.hpp>
#include <mutex>
#include <spdlog/spdlog.h>

namespace ChainFeed {

void TopicTable::Load(const std::vector<TopicSetting>& topics) {
    std::unique_lock lock(share_mutex);
    for (const auto& t : topics) {
        if (t.name.empty()) continue;
        Table[t.name] = t.render;
    }
    spdlog::info("Loaded {} topics into topic table", Table.size());
}

bool TopicTable::FoundTopic(const std::string& topic, RenderMode& mode) const {
    std::shared_lock lock(share_mutex);
    auto it = Table.find(topic);
    if (it != Table.end()) {
        mode = it->second;
        return true;
    }
    return false;
}

RenderMode TopicTable::modeFor(const std::string& topic) const {
    RenderMode mode = default_mode_;
    FoundTopic(topic, mode);
    return mode;
}

size_t TopicTable::size() const {
    std::shared_lock lock(share_mutex);
    return Table.size();
}

} // namespace ChainFeed
