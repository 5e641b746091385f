#pragma once
#include <chainfeed/core/notify/notification.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace ChainFeed {

/**
 * Gap detection policy
 *
 * allow_wraparound = true : counters are compared modulo 2^32, 0xFFFFFFFF -> 0 is contiguous
 * allow_wraparound = false: a sequence not above the last seen one is a publisher restart,
 *                           tracking re-bases without reporting a gap
 * reset_on_reconnect      : Dispatcher forgets all topics every time it (re)connects
 */
struct GapPolicy {
    bool enabled = true;
    bool allow_wraparound = true;
    bool reset_on_reconnect = true;
};

/**
 * @brief Per-topic last-seen sequence bookkeeping.
 *
 * Not thread-safe; owned by a single Dispatcher loop.
 */
class SequenceTracker {
public:
    explicit SequenceTracker(GapPolicy policy = {}) : policy_(policy) {}

    /**
     * @brief Record a sequence for a topic
     * @return The gap if the sequence is not the expected successor, nullopt otherwise
     *         (including the first sighting of a topic and a disabled policy)
     */
    std::optional<SequenceGap> observe(const std::string& topic, uint32_t sequence);

    void reset();

    std::optional<uint32_t> lastSeen(const std::string& topic) const;
    size_t trackedTopics() const { return last_seen_.size(); }
    const GapPolicy& policy() const { return policy_; }

private:
    GapPolicy policy_;
    std::unordered_map<std::string, uint32_t> last_seen_;
};

} // namespace ChainFeed
