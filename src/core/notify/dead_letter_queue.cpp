#include <chainfeed/core/notify/dead_letter_queue.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace ChainFeed {

DeadLetterQueue::DeadLetterQueue(size_t capacity) : capacity_(capacity) {
    spdlog::debug("[DLQ] Initialized (capacity: {})", capacity_);
}

void DeadLetterQueue::push(DeadLetter letter) {
    total_dropped_.fetch_add(1, std::memory_order_relaxed);

    spdlog::debug("[DLQ] Dropped message topic_hint='{}' kind={} frames={} bytes={} (total: {})",
                  letter.topic_hint, toString(letter.kind), letter.frame_count, letter.total_bytes,
                  total_dropped_.load(std::memory_order_relaxed));

    if (capacity_ == 0) return;

    std::lock_guard<std::mutex> lock(mutex_);
    // Ring buffer: remove oldest if at capacity
    if (stored_.size() >= capacity_) {
        stored_.pop_front();
    }
    stored_.push_back(std::move(letter));
}

std::vector<DeadLetter> DeadLetterQueue::getRecent(size_t max_count) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<DeadLetter> result;
    size_t count = std::min(max_count, stored_.size());
    result.reserve(count);

    auto it = stored_.rbegin();
    for (size_t i = 0; i < count && it != stored_.rend(); ++i, ++it) {
        result.push_back(*it);
    }
    return result;
}

void DeadLetterQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    stored_.clear();
    spdlog::info("[DLQ] Buffer cleared (total dropped remains: {})",
                 total_dropped_.load(std::memory_order_relaxed));
}

} // namespace ChainFeed
