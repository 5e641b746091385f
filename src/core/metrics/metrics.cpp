#include <chainfeed/core/metrics/metrics.hpp>
#include <chrono>

namespace ChainFeed {

DispatcherMetricsSnapshot snapshot(const DispatcherMetrics& m) {
    DispatcherMetricsSnapshot snap;
    snap.total_messages_received = m.total_messages_received.load(std::memory_order_relaxed);
    snap.total_records_emitted = m.total_records_emitted.load(std::memory_order_relaxed);
    snap.total_decode_errors = m.total_decode_errors.load(std::memory_order_relaxed);
    snap.total_gaps_detected = m.total_gaps_detected.load(std::memory_order_relaxed);
    snap.total_payload_bytes = m.total_payload_bytes.load(std::memory_order_relaxed);
    snap.last_message_timestamp_ms = m.last_message_timestamp_ms.load(std::memory_order_relaxed);
    return snap;
}

uint64_t nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace ChainFeed
