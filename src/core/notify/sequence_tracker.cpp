#include <chainfeed/core/notify/sequence_tracker.hpp>
#include <spdlog/spdlog.h>

namespace ChainFeed {

std::optional<SequenceGap> SequenceTracker::observe(const std::string& topic, uint32_t sequence) {
    if (!policy_.enabled) return std::nullopt;

    auto [it, inserted] = last_seen_.try_emplace(topic, sequence);
    if (inserted) return std::nullopt;

    const uint32_t last = it->second;
    it->second = sequence;

    if (!policy_.allow_wraparound && sequence <= last) {
        spdlog::info("[SequenceTracker] Topic {} sequence restarted at {} (last {})", topic, sequence, last);
        return std::nullopt;
    }

    // Unsigned arithmetic wraps at 2^32
    const uint32_t expected = last + 1;
    if (sequence == expected) return std::nullopt;

    return SequenceGap{topic, expected, sequence};
}

void SequenceTracker::reset() {
    if (!last_seen_.empty()) {
        spdlog::debug("[SequenceTracker] Forgetting {} tracked topics", last_seen_.size());
    }
    last_seen_.clear();
}

std::optional<uint32_t> SequenceTracker::lastSeen(const std::string& topic) const {
    auto it = last_seen_.find(topic);
    if (it == last_seen_.end()) return std::nullopt;
    return it->second;
}

} // namespace ChainFeed
