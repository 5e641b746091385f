#include <chainfeed/core/notify/frame_classifier.hpp>
#include <algorithm>

namespace ChainFeed {

namespace {

inline bool isPrintableAscii(uint8_t c) {
    return c >= 0x20 && c <= 0x7E;
}

void validateTopic(const Frame& frame, const ClassifierLimits& limits) {
    if (frame.empty())
        throw EncodingError("Topic frame is empty");

    if (frame.size() > limits.max_topic_length)
        throw EncodingError("Topic frame too long: " + std::to_string(frame.size()) +
                            " bytes (max " + std::to_string(limits.max_topic_length) + ")");

    if (!std::all_of(frame.begin(), frame.end(), isPrintableAscii))
        throw EncodingError("Topic frame contains non-printable bytes");
}

} // anonymous namespace

uint32_t readUint32LE(const uint8_t* data) {
    return static_cast<uint32_t>(data[0])
         | (static_cast<uint32_t>(data[1]) << 8)
         | (static_cast<uint32_t>(data[2]) << 16)
         | (static_cast<uint32_t>(data[3]) << 24);
}

NotificationRecord classify(RawMultipartMessage&& raw, const ClassifierLimits& limits) {
    if (raw.frames.size() != kNotificationFrameCount)
        throw FrameCountError("Expected " + std::to_string(kNotificationFrameCount) +
                              " frames, got " + std::to_string(raw.frames.size()));

    const Frame& topicFrame = raw.frames[0];
    validateTopic(topicFrame, limits);

    const Frame& seqFrame = raw.frames[2];
    if (seqFrame.size() != kSequenceFrameSize)
        throw SequenceLengthError("Sequence frame must be " + std::to_string(kSequenceFrameSize) +
                                  " bytes, got " + std::to_string(seqFrame.size()));

    uint32_t sequence = readUint32LE(seqFrame.data());
    std::string topic(topicFrame.begin(), topicFrame.end());

    return NotificationRecord(std::move(topic), std::move(raw.frames[1]), sequence);
}

std::string topicHint(const RawMultipartMessage& raw, size_t max_length) {
    if (raw.frames.empty()) return {};
    const Frame& first = raw.frames.front();
    size_t len = std::min(first.size(), max_length);
    return std::string(first.begin(), first.begin() + static_cast<std::ptrdiff_t>(len));
}

} // namespace ChainFeed
