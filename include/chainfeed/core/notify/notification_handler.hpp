#pragma once

#include <chainfeed/core/notify/notification.hpp>
#include <chainfeed/core/notify/errors.hpp>
#include <functional>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace ChainFeed {

/**
 * @class NotificationHandler
 * @brief Consumer side of a Dispatcher
 *
 * onRecord is called once per successfully classified message, in receipt order,
 * and takes ownership of the record. onDecodeError and onGap are observability
 * hooks and never stop the stream.
 *
 * All hooks run on the Dispatcher's thread.
 */
class NotificationHandler {
public:
    virtual ~NotificationHandler() = default;

    virtual void onRecord(NotificationRecord record) = 0;
    virtual void onDecodeError(const std::string& /*topic_hint*/, const DecodeError& /*error*/) {}
    virtual void onGap(const SequenceGap& /*gap*/) {}

    virtual const char* name() const = 0;
};

using NotificationHandlerPtr = std::shared_ptr<NotificationHandler>;

/**
 * @class LoggingNotificationHandler
 * @brief Logs every hook via spdlog
 */
class LoggingNotificationHandler : public NotificationHandler {
public:
    void onRecord(NotificationRecord record) override {
        spdlog::info("[NOTIFY] {} seq={} payload={} bytes",
                     record.topic(), record.sequence(), record.payload().size());
    }

    void onDecodeError(const std::string& topic_hint, const DecodeError& error) override {
        spdlog::warn("[NOTIFY] Dropped malformed message (topic hint '{}'): {} - {}",
                     topic_hint, toString(error.kind()), error.what());
    }

    void onGap(const SequenceGap& gap) override {
        spdlog::warn("[NOTIFY] Sequence gap on {}: expected {}, got {}",
                     gap.topic, gap.expected, gap.actual);
    }

    const char* name() const override { return "LoggingNotificationHandler"; }
};

/**
 * @class CallbackNotificationHandler
 * @brief Forwards each hook to a user-provided callback; unset callbacks are ignored
 */
class CallbackNotificationHandler : public NotificationHandler {
public:
    using RecordCallback = std::function<void(NotificationRecord)>;
    using DecodeErrorCallback = std::function<void(const std::string&, const DecodeError&)>;
    using GapCallback = std::function<void(const SequenceGap&)>;

    explicit CallbackNotificationHandler(RecordCallback on_record,
                                         DecodeErrorCallback on_decode_error = nullptr,
                                         GapCallback on_gap = nullptr,
                                         const char* name = "CallbackNotificationHandler")
        : on_record_(std::move(on_record)),
          on_decode_error_(std::move(on_decode_error)),
          on_gap_(std::move(on_gap)),
          name_(name) {}

    void onRecord(NotificationRecord record) override {
        if (on_record_) {
            on_record_(std::move(record));
        }
    }

    void onDecodeError(const std::string& topic_hint, const DecodeError& error) override {
        if (on_decode_error_) {
            on_decode_error_(topic_hint, error);
        }
    }

    void onGap(const SequenceGap& gap) override {
        if (on_gap_) {
            on_gap_(gap);
        }
    }

    const char* name() const override { return name_; }

private:
    RecordCallback on_record_;
    DecodeErrorCallback on_decode_error_;
    GapCallback on_gap_;
    const char* name_;
};

} // namespace ChainFeed
