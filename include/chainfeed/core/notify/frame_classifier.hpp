#pragma once
#include <chainfeed/core/notify/notification.hpp>
#include <chainfeed/core/notify/errors.hpp>
#include <string>
#include <cstdint>

namespace ChainFeed {

// Fixed wire layout: [topic][payload][4-byte LE sequence]
constexpr size_t kNotificationFrameCount = 3;
constexpr size_t kSequenceFrameSize = 4;
constexpr size_t kDefaultMaxTopicLength = 32;

struct ClassifierLimits {
    size_t max_topic_length = kDefaultMaxTopicLength;
};

/**
 * @brief Decode a little-endian uint32 regardless of host byte order
 * @param data Pointer to at least 4 bytes
 */
uint32_t readUint32LE(const uint8_t* data);

/**
 * @brief Classify one multipart message into a NotificationRecord
 * @param raw Message to consume; its payload frame is moved into the record on success
 *            and left untouched on failure
 * @param limits Topic length bound
 * @return The decoded record
 * @throws FrameCountError if the message does not have exactly 3 frames
 * @throws EncodingError if the topic frame is empty, too long or not printable ASCII
 * @throws SequenceLengthError if the sequence frame is not exactly 4 bytes
 */
NotificationRecord classify(RawMultipartMessage&& raw, const ClassifierLimits& limits = {});

/**
 * @brief Best-effort topic of a message for error reporting
 * @return First frame as text truncated to max_length, or empty if there is no frame
 */
std::string topicHint(const RawMultipartMessage& raw, size_t max_length = kDefaultMaxTopicLength);

} // namespace ChainFeed
