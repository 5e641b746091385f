#pragma once
#include <chainfeed/core/notify/dispatcher_state.hpp>
#include <chainfeed/core/notify/frame_classifier.hpp>
#include <chainfeed/core/notify/sequence_tracker.hpp>
#include <chainfeed/core/notify/notification_handler.hpp>
#include <chainfeed/core/notify/dead_letter_queue.hpp>
#include <chainfeed/core/metrics/metrics.hpp>
#include <chainfeed/core/transport/transport.hpp>
#include <atomic>
#include <chrono>
#include <string>
#include <spdlog/spdlog.h>

namespace ChainFeed {

struct DispatcherOptions {
    std::string name = "dispatcher";
    // Upper bound of one wait on the transport, i.e. the stop() reaction time
    std::chrono::milliseconds poll_interval{100};
    ClassifierLimits limits;
    GapPolicy gap_policy;
    size_t dead_letter_capacity = DeadLetterQueue::DEFAULT_CAPACITY;
};

/**
 * @class Dispatcher
 * @brief Receive -> classify -> emit loop over one Transport.
 *
 * One message is in flight at a time and records are emitted in receipt order.
 * Malformed messages are dropped and reported, transport failures end the run.
 * Instances share no mutable state, so several can run on their own threads.
 */
class Dispatcher {
public:
    explicit Dispatcher(NotificationHandlerPtr handler, DispatcherOptions options = {});
    ~Dispatcher() noexcept = default;

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /**
     * @brief Run the loop over an already connected transport
     *
     * Returns normally once stop() has been requested.
     * @throws TransportError when the transport fails; the dispatcher is CLOSED
     */
    void run(Transport& transport);

    /**
     * @brief Connect, run, and close the transport on every exit path
     * @throws ConnectError if the connector cannot establish the connection
     * @throws TransportError when the connection is lost mid-stream
     */
    void run(const TransportConnector& connector, const std::string& endpoint,
             const std::string& topic_filter);

    // Thread-safe. Terminal: later run() calls return immediately.
    void stop();
    bool stopRequested() const { return stop_requested_.load(std::memory_order_acquire); }

    DispatcherState state() const { return state_.load(std::memory_order_acquire); }
    DispatcherMetricsSnapshot metrics() const { return snapshot(metrics_); }
    const DeadLetterQueue& deadLetters() const { return dead_letters_; }
    const DispatcherOptions& options() const { return options_; }

private:
    void handleMessage(RawMultipartMessage&& raw);
    void setState(DispatcherState next);

    NotificationHandlerPtr handler_;
    DispatcherOptions options_;

    std::atomic<bool> stop_requested_{false};
    std::atomic<DispatcherState> state_{DispatcherState::IDLE};

    SequenceTracker tracker_;       // Dispatcher thread only
    DeadLetterQueue dead_letters_;
    DispatcherMetrics metrics_;
};

} // namespace ChainFeed
