#include <chainfeed/core/notify/dispatcher.hpp>
#include <optional>
#include <utility>

namespace ChainFeed {

namespace {

// Closes the transport when the run scope is left, whatever the reason
class TransportCloser {
public:
    explicit TransportCloser(Transport& t) : transport_(t) {}
    ~TransportCloser() { transport_.close(); }

    TransportCloser(const TransportCloser&) = delete;
    TransportCloser& operator=(const TransportCloser&) = delete;

private:
    Transport& transport_;
};

// Runs fn when the enclosing scope is left, including by a non-std exception
template <typename Fn>
class ScopeExit {
public:
    explicit ScopeExit(Fn fn) : fn_(std::move(fn)) {}
    ~ScopeExit() { fn_(); }

    ScopeExit(const ScopeExit&) = delete;
    ScopeExit& operator=(const ScopeExit&) = delete;

private:
    Fn fn_;
};

} // anonymous namespace

Dispatcher::Dispatcher(NotificationHandlerPtr handler, DispatcherOptions options)
    : handler_(std::move(handler)),
      options_(std::move(options)),
      tracker_(options_.gap_policy),
      dead_letters_(options_.dead_letter_capacity) {
    if (!handler_) {
        handler_ = std::make_shared<LoggingNotificationHandler>();
    }
    spdlog::info("[Dispatcher] {} created (handler={}, poll={}ms, gap_detection={})",
                 options_.name, handler_->name(), options_.poll_interval.count(),
                 options_.gap_policy.enabled);
}

void Dispatcher::stop() {
    stop_requested_.store(true, std::memory_order_release);
    spdlog::info("[Dispatcher] {} stop requested", options_.name);
}

void Dispatcher::run(const TransportConnector& connector, const std::string& endpoint,
                     const std::string& topic_filter) {
    if (stopRequested()) {
        setState(DispatcherState::CLOSED);
        return;
    }

    TransportPtr transport;
    try {
        transport = connector(endpoint, topic_filter);
    } catch (const ConnectError& e) {
        spdlog::error("[Dispatcher] {} cannot connect to {}: {}", options_.name, endpoint, e.what());
        setState(DispatcherState::CLOSED);
        throw;
    }
    if (!transport) {
        setState(DispatcherState::CLOSED);
        throw ConnectError("Connector returned no transport for " + endpoint);
    }

    if (options_.gap_policy.reset_on_reconnect) {
        tracker_.reset();
    }

    TransportCloser closer(*transport);
    run(*transport);
}

void Dispatcher::run(Transport& transport) {
    if (stopRequested()) {
        setState(DispatcherState::CLOSED);
        return;
    }

    ScopeExit markClosed([this] { setState(DispatcherState::CLOSED); });
    setState(DispatcherState::CONNECTED);
    spdlog::info("[Dispatcher] {} loop started on {}", options_.name, transport.endpoint());

    try {
        while (!stopRequested()) {
            setState(DispatcherState::RECEIVING);
            auto raw = transport.receive(options_.poll_interval);
            if (!raw) {
                continue;
            }

            setState(DispatcherState::DECODING);
            handleMessage(std::move(*raw));
        }
    } catch (const TransportError& e) {
        spdlog::error("[Dispatcher] {} transport failure on {}: {}", options_.name,
                      transport.endpoint(), e.what());
        throw;
    } catch (const std::exception& e) {
        spdlog::error("[Dispatcher] {} loop aborted: {}", options_.name, e.what());
        throw;
    }

    setState(DispatcherState::CLOSED);
    auto m = metrics();
    spdlog::info("[Dispatcher] {} loop stopped (received={}, emitted={}, decode_errors={}, gaps={})",
                 options_.name, m.total_messages_received, m.total_records_emitted,
                 m.total_decode_errors, m.total_gaps_detected);
}

void Dispatcher::handleMessage(RawMultipartMessage&& raw) {
    metrics_.total_messages_received.fetch_add(1, std::memory_order_relaxed);
    metrics_.last_message_timestamp_ms.store(nowMs(), std::memory_order_relaxed);

    std::optional<NotificationRecord> record;
    try {
        record.emplace(classify(std::move(raw), options_.limits));
    } catch (const DecodeError& e) {
        metrics_.total_decode_errors.fetch_add(1, std::memory_order_relaxed);
        std::string hint = topicHint(raw, options_.limits.max_topic_length);
        spdlog::warn("[Dispatcher] {} dropped malformed message (topic hint '{}', {} frames): {}",
                     options_.name, hint, raw.frames.size(), e.what());

        dead_letters_.push(DeadLetter{hint, e.kind(), e.what(), raw.frames.size(),
                                      raw.totalBytes(), nowMs()});
        handler_->onDecodeError(hint, e);
        return;
    }

    metrics_.total_payload_bytes.fetch_add(record->payload().size(), std::memory_order_relaxed);
    spdlog::debug("[Dispatcher] {} decoded {} seq={} ({} bytes)", options_.name,
                  record->topic(), record->sequence(), record->payload().size());

    if (auto gap = tracker_.observe(record->topic(), record->sequence())) {
        metrics_.total_gaps_detected.fetch_add(1, std::memory_order_relaxed);
        spdlog::warn("[Dispatcher] {} sequence gap on {}: expected {}, got {}",
                     options_.name, gap->topic, gap->expected, gap->actual);
        handler_->onGap(*gap);
    }

    handler_->onRecord(std::move(*record));
    metrics_.total_records_emitted.fetch_add(1, std::memory_order_relaxed);
}

void Dispatcher::setState(DispatcherState next) {
    DispatcherState prev = state_.exchange(next, std::memory_order_acq_rel);
    if (prev == next) return;

    // RECEIVING <-> DECODING flips once per message
    if ((prev == DispatcherState::RECEIVING && next == DispatcherState::DECODING) ||
        (prev == DispatcherState::DECODING && next == DispatcherState::RECEIVING)) {
        return;
    }
    spdlog::info("[Dispatcher] {} state transition: {} -> {}", options_.name, toString(prev), toString(next));
}

const char* toString(DispatcherState state) {
    switch (state) {
        case DispatcherState::IDLE:       return "IDLE";
        case DispatcherState::CONNECTED:  return "CONNECTED";
        case DispatcherState::RECEIVING:  return "RECEIVING";
        case DispatcherState::DECODING:   return "DECODING";
        case DispatcherState::CLOSED:     return "CLOSED";
        default:                          return "UNKNOWN";
    }
}

} // namespace ChainFeed
