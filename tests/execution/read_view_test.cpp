/**
 * @file read_view_test.cpp
 * @brief Unit tests for VersionedReadView
 */

#include <gtest/gtest.h>

#include "execution/read_view.hpp"
#include "storage/memory_state.hpp"

namespace tessera {
namespace {

TEST(ReadViewTest, FallsBackToPriorState) {
  VersionStore store;
  MemoryState base{{"A", "base"}};
  VersionedReadView view(store, base, 3, true);

  ReadResult a = view.get("A");
  EXPECT_EQ(a.status, ReadStatus::kValue);
  EXPECT_EQ(a.value, "base");
  EXPECT_EQ(view.get("missing").status, ReadStatus::kAbsent);
  EXPECT_EQ(view.txn_index(), 3);

  auto reads = view.take_reads();
  ASSERT_EQ(reads.size(), 2);
  EXPECT_EQ(reads[0].origin, ReadOrigin::kStorage);
  EXPECT_EQ(reads[1].origin, ReadOrigin::kStorage);
}

TEST(ReadViewTest, PrefersLowerVersion) {
  VersionStore store;
  ASSERT_EQ(store.write("A", TxnVersion(1, 2), "v", CommitRacePolicy::kFirstWins),
            WriteOutcome::kInstalled);
  ASSERT_EQ(store.write("A", TxnVersion(5, 0), "above", CommitRacePolicy::kFirstWins),
            WriteOutcome::kInstalled);
  MemoryState base{{"A", "base"}};
  VersionedReadView view(store, base, 3, true);

  EXPECT_EQ(view.get("A").value, "v");
  auto reads = view.take_reads();
  ASSERT_EQ(reads.size(), 1);
  EXPECT_EQ(reads[0].origin, ReadOrigin::kVersion);
  EXPECT_EQ(reads[0].version, TxnVersion(1, 2));
}

TEST(ReadViewTest, RepeatedReadIsRecordedOnce) {
  VersionStore store;
  MemoryState base{{"A", "1"}};
  VersionedReadView view(store, base, 1, true);

  EXPECT_EQ(view.get("A").value, "1");
  ASSERT_EQ(store.write("A", TxnVersion(0, 0), "changed", CommitRacePolicy::kFirstWins),
            WriteOutcome::kInstalled);
  EXPECT_EQ(view.get("A").value, "1");
  EXPECT_EQ(view.take_reads().size(), 1);
}

TEST(ReadViewTest, EstimateBlocksWithEarlyDetection) {
  VersionStore store;
  ASSERT_TRUE(store.mark_estimate("A", TxnVersion(2, 0)));
  MemoryState base{{"A", "base"}, {"B", "b"}};
  VersionedReadView view(store, base, 4, true);

  ReadResult result = view.get("A");
  EXPECT_TRUE(result.is_blocked());
  EXPECT_EQ(result.blocking_txn, 2);
  EXPECT_TRUE(view.blocked());
  EXPECT_EQ(view.blocking_txn(), 2);

  // Everything after the first blocked read reports the same dependency
  EXPECT_TRUE(view.get("B").is_blocked());
  EXPECT_TRUE(view.take_reads().empty());
}

TEST(ReadViewTest, EstimateReadThroughWithoutEarlyDetection) {
  VersionStore store;
  ASSERT_TRUE(store.mark_estimate("A", TxnVersion(2, 0)));
  MemoryState base{{"A", "base"}};
  VersionedReadView view(store, base, 4, false);

  ReadResult result = view.get("A");
  EXPECT_EQ(result.status, ReadStatus::kValue);
  EXPECT_EQ(result.value, "base");
  EXPECT_FALSE(view.blocked());

  // The recorded read cannot validate while the estimate is there
  auto reads = view.take_reads();
  ASSERT_EQ(reads.size(), 1);
  EXPECT_FALSE(store.validate_read(reads[0], 4));
}

}  // namespace
}  // namespace tessera
