/**
 * @file rescheduler_test.cpp
 * @brief Unit tests for retry placement and conflict epochs
 */

#include <gtest/gtest.h>

#include <mutex>
#include <vector>

#include "scheduler/rescheduler.hpp"

namespace tessera {
namespace {

void set_state(TransactionStatusTable& table, txn_idx_t idx, TransactionState state) {
  TxnSlot& slot = table.slot(idx);
  std::lock_guard<std::mutex> lock(slot.mutex);
  slot.state = state;
}

TxnHint hint(std::vector<StateKey> reads, std::vector<StateKey> writes) {
  TxnHint result;
  result.read_keys = std::move(reads);
  result.write_keys = std::move(writes);
  return result;
}

// ─────────────────────────────────────────────────────────────────────────────
// Placement
// ─────────────────────────────────────────────────────────────────────────────

TEST(ReschedulerTest, ImmediateNeverWaits) {
  TransactionStatusTable table(3);
  DependencyTracker tracker(3);
  ImmediateRescheduler rescheduler;

  EXPECT_EQ(rescheduler.place(2, table, tracker), INVALID_TXN_IDX);
  EXPECT_TRUE(rescheduler.premarked_keys(2).empty());
}

TEST(ReschedulerTest, DeferredPicksHighestConflictingInFlightWriter) {
  LocalityHints hints = {hint({}, {"A"}), hint({}, {"A"}), hint({}, {"B"}),
                         hint({"A"}, {"C"})};
  TransactionStatusTable table(4);
  DependencyTracker tracker(4);
  DeferredRescheduler rescheduler(hints);

  // Txn 2 is in flight but writes B only
  EXPECT_EQ(rescheduler.place(3, table, tracker), 1);

  set_state(table, 1, TransactionState::EXECUTED);
  EXPECT_EQ(rescheduler.place(3, table, tracker), 0);

  set_state(table, 0, TransactionState::COMMITTED);
  EXPECT_EQ(rescheduler.place(3, table, tracker), INVALID_TXN_IDX);
}

TEST(ReschedulerTest, DeferredFallsBackToReadFrom) {
  TransactionStatusTable table(4);
  DependencyTracker tracker(4);
  tracker.record(3, {ReadDescriptor::from_version("A", TxnVersion(0, 0)),
                     ReadDescriptor::from_version("B", TxnVersion(2, 0))});
  DeferredRescheduler rescheduler(LocalityHints{});

  EXPECT_EQ(rescheduler.place(3, table, tracker), 2);
  set_state(table, 2, TransactionState::VALIDATING);
  EXPECT_EQ(rescheduler.place(3, table, tracker), 0);
}

TEST(ReschedulerTest, DeferredPremarksDeclaredWrites) {
  LocalityHints hints = {hint({"A"}, {"B", "C", "B"})};
  DeferredRescheduler rescheduler(hints);

  EXPECT_EQ(rescheduler.premarked_keys(0), (std::vector<StateKey>{"B", "C"}));
  EXPECT_TRUE(rescheduler.premarked_keys(5).empty());
}

TEST(ReschedulerTest, FactoryHonorsOptions) {
  EngineOptions options;
  EXPECT_STREQ(make_rescheduler(options, {})->name(), "immediate");
  options.enable_rescheduling = true;
  EXPECT_STREQ(make_rescheduler(options, {})->name(), "deferred");
}

// ─────────────────────────────────────────────────────────────────────────────
// Conflict Epochs
// ─────────────────────────────────────────────────────────────────────────────

TEST(ConflictEpochTest, DisjointTransactionsShareOneEpoch) {
  LocalityHints hints = {hint({"a"}, {"a"}), hint({"b"}, {"b"}), hint({"c"}, {"c"})};
  std::vector<size_t> epochs;

  EXPECT_EQ(plan_conflict_epochs(hints, &epochs), 1);
  EXPECT_EQ(epochs, (std::vector<size_t>{0, 0, 0}));
}

TEST(ConflictEpochTest, ConflictsMoveToLowestFreeEpoch) {
  LocalityHints hints = {
      hint({"a"}, {"a"}),  // epoch 0
      hint({"a"}, {"b"}),  // reads a -> epoch 1
      hint({"b"}, {"c"}),  // reads b -> epoch 0 is free of b
      hint({"c"}, {"d"}),  // c written in epoch 0 -> epoch 1
  };
  std::vector<size_t> epochs;

  EXPECT_EQ(plan_conflict_epochs(hints, &epochs), 2);
  EXPECT_EQ(epochs, (std::vector<size_t>{0, 1, 0, 1}));
}

TEST(ConflictEpochTest, EmptyHints) {
  EXPECT_EQ(plan_conflict_epochs({}, nullptr), 0);
}

}  // namespace
}  // namespace tessera
