// ============================================================================
// DEAD LETTER QUEUE UNIT TESTS
// ============================================================================

#include <gtest/gtest.h>
#include <chainfeed/core/notify/dead_letter_queue.hpp>
#include <thread>
#include <vector>

using namespace ChainFeed;

namespace {

DeadLetter letter(const std::string& hint, DecodeErrorKind kind = DecodeErrorKind::FRAME_COUNT) {
    return DeadLetter{hint, kind, "test", 2, 10, 0};
}

} // namespace

TEST(DeadLetterQueue, KeepsNewestFirst) {
    DeadLetterQueue dlq(10);
    dlq.push(letter("a"));
    dlq.push(letter("b"));
    dlq.push(letter("c", DecodeErrorKind::ENCODING));

    auto recent = dlq.getRecent(2);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].topic_hint, "c");
    EXPECT_EQ(recent[0].kind, DecodeErrorKind::ENCODING);
    EXPECT_EQ(recent[1].topic_hint, "b");
}

TEST(DeadLetterQueue, DropsOldestAtCapacity) {
    DeadLetterQueue dlq(3);
    for (int i = 0; i < 5; ++i) {
        dlq.push(letter(std::to_string(i)));
    }

    EXPECT_EQ(dlq.size(), 3u);
    EXPECT_EQ(dlq.totalDropped(), 5u);

    auto recent = dlq.getRecent(10);
    ASSERT_EQ(recent.size(), 3u);
    EXPECT_EQ(recent.back().topic_hint, "2");
}

TEST(DeadLetterQueue, ZeroCapacityOnlyCounts) {
    DeadLetterQueue dlq(0);
    dlq.push(letter("x"));
    EXPECT_EQ(dlq.size(), 0u);
    EXPECT_EQ(dlq.totalDropped(), 1u);
}

TEST(DeadLetterQueue, ClearKeepsTotal) {
    DeadLetterQueue dlq;
    dlq.push(letter("x"));
    dlq.push(letter("y"));
    dlq.clear();

    EXPECT_EQ(dlq.size(), 0u);
    EXPECT_EQ(dlq.totalDropped(), 2u);
}

TEST(DeadLetterQueue, ConcurrentReadersWhileWriting) {
    DeadLetterQueue dlq(50);
    std::thread writer([&dlq]() {
        for (int i = 0; i < 1000; ++i) dlq.push(letter("w"));
    });
    for (int i = 0; i < 100; ++i) {
        EXPECT_LE(dlq.getRecent(100).size(), 50u);
    }
    writer.join();
    EXPECT_EQ(dlq.totalDropped(), 1000u);
    EXPECT_EQ(dlq.size(), 50u);
}
