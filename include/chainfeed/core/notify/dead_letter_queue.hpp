#pragma once

#include <chainfeed/core/notify/errors.hpp>
#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace ChainFeed {

/**
 * @struct DeadLetter
 * @brief Summary of one malformed message the Dispatcher dropped
 */
struct DeadLetter {
    std::string topic_hint;
    DecodeErrorKind kind;
    std::string reason;
    size_t frame_count;
    size_t total_bytes;
    uint64_t timestamp_ms;
};

/**
 * @class DeadLetterQueue
 * @brief Bounded record of dropped malformed messages.
 *
 * Keeps the most recent `capacity` entries for debugging and a cumulative
 * drop counter. Frames themselves are not retained.
 *
 * Thread-safe: written by the Dispatcher thread, readable from anywhere.
 */
class DeadLetterQueue {
public:
    static constexpr size_t DEFAULT_CAPACITY = 100;

    explicit DeadLetterQueue(size_t capacity = DEFAULT_CAPACITY);
    ~DeadLetterQueue() = default;

    void push(DeadLetter letter);

    /**
     * @brief Get total count of messages ever dropped
     */
    size_t totalDropped() const {
        return total_dropped_.load(std::memory_order_relaxed);
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stored_.size();
    }

    size_t capacity() const { return capacity_; }

    /**
     * @brief Get recent dead letters, newest first
     */
    std::vector<DeadLetter> getRecent(size_t max_count = 10) const;

    /**
     * @brief Clear stored entries; totalDropped() is unaffected
     */
    void clear();

private:
    const size_t capacity_;
    std::atomic<size_t> total_dropped_{0};
    mutable std::mutex mutex_;
    std::deque<DeadLetter> stored_;
};

} // namespace ChainFeed
