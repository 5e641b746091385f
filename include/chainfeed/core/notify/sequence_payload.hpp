#pragma once
#include <chainfeed/core/notify/errors.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ChainFeed {

/**
 * Payload of the "sequence" topic:
 *   <32-byte hash><1-byte label>[<8-byte LE mempool sequence>]
 *
 *   'C' block connected        'D' block disconnected
 *   'A' tx added to mempool    'R' tx removed from mempool
 *
 * Only 'A' and 'R' carry the mempool sequence.
 */
enum class SequenceLabel : char {
    BLOCK_CONNECTED = 'C',
    BLOCK_DISCONNECTED = 'D',
    MEMPOOL_ADDED = 'A',
    MEMPOOL_REMOVED = 'R'
};

struct SequenceNotice {
    std::string hash_hex;
    SequenceLabel label;
    std::optional<uint64_t> mempool_sequence;
};

constexpr size_t kHashSize = 32;

/**
 * @throws EncodingError on an unknown label or a length that does not match it
 */
SequenceNotice decodeSequencePayload(const std::vector<uint8_t>& payload);

const char* toString(SequenceLabel label);

} // namespace ChainFeed
