#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace ChainFeed {

using Frame = std::vector<uint8_t>;

/**
 * @brief One multipart message as delivered by a Transport.
 *
 * Frames arrive together or not at all. Owned by the receive cycle that
 * produced it and moved into the classifier.
 */
struct RawMultipartMessage {
    std::vector<Frame> frames;

    size_t totalBytes() const {
        size_t n = 0;
        for (const auto& f : frames) n += f.size();
        return n;
    }
};

/**
 * @brief Decoded notification: [topic, payload, sequence].
 *
 * Read-only after construction. Handed to exactly one consumer.
 */
class NotificationRecord {
public:
    NotificationRecord(std::string topic, std::vector<uint8_t> payload, uint32_t sequence)
        : topic_(std::move(topic)), payload_(std::move(payload)), sequence_(sequence) {}

    const std::string& topic() const { return topic_; }
    const std::vector<uint8_t>& payload() const { return payload_; }
    uint32_t sequence() const { return sequence_; }

private:
    std::string topic_;
    std::vector<uint8_t> payload_;
    uint32_t sequence_;
};

// Observability signal, not an error
struct SequenceGap {
    std::string topic;
    uint32_t expected;
    uint32_t actual;
};

inline bool operator==(const SequenceGap& a, const SequenceGap& b) {
    return a.topic == b.topic && a.expected == b.expected && a.actual == b.actual;
}

} // namespace ChainFeed
