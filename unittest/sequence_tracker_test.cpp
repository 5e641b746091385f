// ============================================================================
// SEQUENCE TRACKER UNIT TESTS
// ============================================================================
// Tests for per-topic gap detection and its wrap/reset policy
// ============================================================================

#include <gtest/gtest.h>
#include <chainfeed/core/notify/sequence_tracker.hpp>
#include <vector>

using namespace ChainFeed;

namespace {

std::vector<SequenceGap> feed(SequenceTracker& tracker, const std::string& topic,
                              const std::vector<uint32_t>& seqs) {
    std::vector<SequenceGap> gaps;
    for (uint32_t s : seqs) {
        if (auto gap = tracker.observe(topic, s)) {
            gaps.push_back(*gap);
        }
    }
    return gaps;
}

} // namespace

TEST(SequenceTracker, ContiguousSequenceHasNoGap) {
    SequenceTracker tracker;
    EXPECT_TRUE(feed(tracker, "hashblock", {5, 6, 7}).empty());
}

TEST(SequenceTracker, ReportsSingleGap) {
    SequenceTracker tracker;
    auto gaps = feed(tracker, "hashblock", {5, 6, 8});

    ASSERT_EQ(gaps.size(), 1u);
    EXPECT_EQ(gaps[0], (SequenceGap{"hashblock", 7, 8}));
}

TEST(SequenceTracker, FirstSightingIsNeverAGap) {
    SequenceTracker tracker;
    EXPECT_FALSE(tracker.observe("rawtx", 1000).has_value());
    EXPECT_EQ(tracker.lastSeen("rawtx"), 1000u);
}

TEST(SequenceTracker, TopicsAreIndependent) {
    SequenceTracker tracker;
    EXPECT_FALSE(tracker.observe("rawtx", 10).has_value());
    EXPECT_FALSE(tracker.observe("hashblock", 0).has_value());
    EXPECT_FALSE(tracker.observe("rawtx", 11).has_value());
    EXPECT_FALSE(tracker.observe("hashblock", 1).has_value());
    EXPECT_EQ(tracker.trackedTopics(), 2u);
}

TEST(SequenceTracker, WraparoundIsContiguousByDefault) {
    SequenceTracker tracker;
    EXPECT_TRUE(feed(tracker, "rawtx", {0xFFFFFFFEu, 0xFFFFFFFFu, 0u, 1u}).empty());
}

TEST(SequenceTracker, GapAcrossWraparound) {
    SequenceTracker tracker;
    auto gaps = feed(tracker, "rawtx", {0xFFFFFFFFu, 2u});
    ASSERT_EQ(gaps.size(), 1u);
    EXPECT_EQ(gaps[0].expected, 0u);
    EXPECT_EQ(gaps[0].actual, 2u);
}

TEST(SequenceTracker, BackwardsJumpIsAGapWithWraparound) {
    SequenceTracker tracker;
    auto gaps = feed(tracker, "rawtx", {100, 3});
    ASSERT_EQ(gaps.size(), 1u);
    EXPECT_EQ(gaps[0], (SequenceGap{"rawtx", 101, 3}));
}

TEST(SequenceTracker, RestartWithoutWraparoundRebases) {
    GapPolicy policy;
    policy.allow_wraparound = false;
    SequenceTracker tracker(policy);

    // 100 -> 0 is a publisher restart, 0 -> 1 continues from the new base
    EXPECT_TRUE(feed(tracker, "rawtx", {99, 100, 0, 1}).empty());
    EXPECT_EQ(tracker.lastSeen("rawtx"), 1u);

    auto gaps = feed(tracker, "rawtx", {5});
    ASSERT_EQ(gaps.size(), 1u);
    EXPECT_EQ(gaps[0], (SequenceGap{"rawtx", 2, 5}));
}

TEST(SequenceTracker, DisabledPolicyReportsNothing) {
    GapPolicy policy;
    policy.enabled = false;
    SequenceTracker tracker(policy);

    EXPECT_TRUE(feed(tracker, "rawtx", {1, 5, 2, 90}).empty());
    EXPECT_EQ(tracker.trackedTopics(), 0u);
}

TEST(SequenceTracker, ResetForgetsTopics) {
    SequenceTracker tracker;
    feed(tracker, "rawtx", {1, 2});
    tracker.reset();

    EXPECT_EQ(tracker.trackedTopics(), 0u);
    EXPECT_FALSE(tracker.lastSeen("rawtx").has_value());
    EXPECT_TRUE(feed(tracker, "rawtx", {50}).empty());
}
