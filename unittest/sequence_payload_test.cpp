// ============================================================================
// SEQUENCE PAYLOAD UNIT TESTS
// ============================================================================
// Tests for the "sequence" topic payload: <hash><label>[<mempool seq>]
// ============================================================================

#include <gtest/gtest.h>
#include <chainfeed/core/notify/sequence_payload.hpp>
#include <vector>

using namespace ChainFeed;

namespace {

std::vector<uint8_t> notice(char label, std::vector<uint8_t> tail = {}) {
    std::vector<uint8_t> payload(kHashSize);
    for (size_t i = 0; i < kHashSize; ++i) payload[i] = static_cast<uint8_t>(i);
    payload.push_back(static_cast<uint8_t>(label));
    payload.insert(payload.end(), tail.begin(), tail.end());
    return payload;
}

} // namespace

TEST(SequencePayload, BlockConnected) {
    auto n = decodeSequencePayload(notice('C'));
    EXPECT_EQ(n.label, SequenceLabel::BLOCK_CONNECTED);
    EXPECT_FALSE(n.mempool_sequence.has_value());
    EXPECT_EQ(n.hash_hex.size(), 64u);
    EXPECT_EQ(n.hash_hex.substr(0, 8), "00010203");
}

TEST(SequencePayload, BlockDisconnected) {
    auto n = decodeSequencePayload(notice('D'));
    EXPECT_EQ(n.label, SequenceLabel::BLOCK_DISCONNECTED);
    EXPECT_FALSE(n.mempool_sequence.has_value());
}

TEST(SequencePayload, MempoolAddedCarriesLittleEndianSequence) {
    auto n = decodeSequencePayload(notice('A', {0x01, 0x02, 0x00, 0x00, 0x00, 0x00, 0x00, 0x80}));
    EXPECT_EQ(n.label, SequenceLabel::MEMPOOL_ADDED);
    ASSERT_TRUE(n.mempool_sequence.has_value());
    EXPECT_EQ(*n.mempool_sequence, 0x8000000000000201ull);
}

TEST(SequencePayload, MempoolRemoved) {
    auto n = decodeSequencePayload(notice('R', {0x05, 0, 0, 0, 0, 0, 0, 0}));
    EXPECT_EQ(n.label, SequenceLabel::MEMPOOL_REMOVED);
    EXPECT_EQ(n.mempool_sequence.value_or(0), 5u);
}

TEST(SequencePayload, RejectsMalformedPayloads) {
    EXPECT_THROW(decodeSequencePayload(std::vector<uint8_t>(kHashSize, 0)), EncodingError);
    EXPECT_THROW(decodeSequencePayload(notice('X')), EncodingError);
    EXPECT_THROW(decodeSequencePayload(notice('C', {0x00})), EncodingError);
    EXPECT_THROW(decodeSequencePayload(notice('A')), EncodingError);
    EXPECT_THROW(decodeSequencePayload(notice('R', {0x01, 0x02})), EncodingError);
}
