#include <chainfeed/core/notify/sequence_payload.hpp>
#include <chainfeed/core/notify/payload_renderer.hpp>

namespace ChainFeed {

namespace {

constexpr size_t kLabelOffset = kHashSize;
constexpr size_t kBlockNoticeSize = kHashSize + 1;
constexpr size_t kMempoolNoticeSize = kHashSize + 1 + 8;

inline uint64_t readUint64LE(const uint8_t* data) {
    uint64_t v = 0;
    for (int i = 7; i >= 0; --i) {
        v = (v << 8) | data[i];
    }
    return v;
}

} // anonymous namespace

SequenceNotice decodeSequencePayload(const std::vector<uint8_t>& payload) {
    if (payload.size() < kBlockNoticeSize)
        throw EncodingError("Sequence payload too small: " + std::to_string(payload.size()) + " bytes");

    SequenceNotice notice;
    notice.hash_hex = hexEncode(payload.data(), kHashSize);

    const char label = static_cast<char>(payload[kLabelOffset]);
    switch (label) {
        case 'C':
        case 'D':
            if (payload.size() != kBlockNoticeSize)
                throw EncodingError(std::string("Block sequence notice '") + label + "' must be " +
                                    std::to_string(kBlockNoticeSize) + " bytes");
            notice.label = static_cast<SequenceLabel>(label);
            break;
        case 'A':
        case 'R':
            if (payload.size() != kMempoolNoticeSize)
                throw EncodingError(std::string("Mempool sequence notice '") + label + "' must be " +
                                    std::to_string(kMempoolNoticeSize) + " bytes");
            notice.label = static_cast<SequenceLabel>(label);
            notice.mempool_sequence = readUint64LE(payload.data() + kBlockNoticeSize);
            break;
        default:
            throw EncodingError("Unknown sequence label byte " + std::to_string(static_cast<uint8_t>(label)));
    }
    return notice;
}

const char* toString(SequenceLabel label) {
    switch (label) {
        case SequenceLabel::BLOCK_CONNECTED:     return "BLOCK_CONNECTED";
        case SequenceLabel::BLOCK_DISCONNECTED:  return "BLOCK_DISCONNECTED";
        case SequenceLabel::MEMPOOL_ADDED:       return "MEMPOOL_ADDED";
        case SequenceLabel::MEMPOOL_REMOVED:     return "MEMPOOL_REMOVED";
        default:                                 return "UNKNOWN";
    }
}

} // namespace ChainFeed
