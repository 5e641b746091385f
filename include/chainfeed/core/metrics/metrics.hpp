#pragma once
#include <atomic>
#include <cstdint>

namespace ChainFeed {

/**
 * @brief Per-dispatcher counters
 *
 * All counters are lock-free atomics with relaxed ordering. Written by the
 * Dispatcher thread only, read from anywhere through snapshot().
 */
struct DispatcherMetrics {
    std::atomic<uint64_t> total_messages_received{0};   // Multipart messages pulled from the transport
    std::atomic<uint64_t> total_records_emitted{0};     // Records handed to onRecord
    std::atomic<uint64_t> total_decode_errors{0};       // Malformed messages dropped
    std::atomic<uint64_t> total_gaps_detected{0};
    std::atomic<uint64_t> total_payload_bytes{0};
    std::atomic<uint64_t> last_message_timestamp_ms{0};
};

/**
 * Non-atomic copy of DispatcherMetrics for consistent reads
 */
struct DispatcherMetricsSnapshot {
    uint64_t total_messages_received = 0;
    uint64_t total_records_emitted = 0;
    uint64_t total_decode_errors = 0;
    uint64_t total_gaps_detected = 0;
    uint64_t total_payload_bytes = 0;
    uint64_t last_message_timestamp_ms = 0;

    double get_decode_error_rate_percent() const {
        return total_messages_received > 0
            ? (total_decode_errors * 100.0) / total_messages_received
            : 0.0;
    }
};

DispatcherMetricsSnapshot snapshot(const DispatcherMetrics& m);

uint64_t nowMs();

} // namespace ChainFeed
