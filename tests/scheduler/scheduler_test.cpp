/**
 * @file scheduler_test.cpp
 * @brief Unit tests for the Scheduler state machine
 *
 * These tests drive the scheduler by hand from a single thread: they take
 * tasks and report results the way a worker would.
 */

#include <gtest/gtest.h>

#include <memory>
#include <vector>

#include "scheduler/scheduler.hpp"

namespace tessera {
namespace {

/**
 * @brief Everything a scheduler needs for one block
 */
struct Harness {
  explicit Harness(size_t n, const EngineOptions& options = {}, const LocalityHints& hints = {})
      : tracker(n),
        policy(make_conflict_policy(options)),
        rescheduler(make_rescheduler(options, hints)),
        scheduler(n, store, tracker, *policy, *rescheduler, options.abort_storm_threshold) {}

  TxnVersion expect_execute() {
    Task task = scheduler.next_task();
    EXPECT_EQ(task.kind, TaskKind::kExecute);
    return task.version;
  }

  VersionStore store;
  DependencyTracker tracker;
  std::unique_ptr<ConflictPolicy> policy;
  std::unique_ptr<Rescheduler> rescheduler;
  Scheduler scheduler;
};

// ─────────────────────────────────────────────────────────────────────────────
// Happy Path
// ─────────────────────────────────────────────────────────────────────────────

TEST(SchedulerTest, ExecutesInIndexOrderThenCommits) {
  Harness h(2);

  EXPECT_EQ(h.expect_execute(), TxnVersion(0, 0));
  EXPECT_EQ(h.expect_execute(), TxnVersion(1, 0));

  ASSERT_TRUE(h.scheduler.finish_execution(TxnVersion(0, 0), {}, {{"A", "1"}},
                                           Outcome::Success()).ok());
  ASSERT_TRUE(h.scheduler.finish_execution(
      TxnVersion(1, 0), {ReadDescriptor::from_version("A", TxnVersion(0, 0))},
      {{"B", "2"}}, Outcome::Success()).ok());

  ASSERT_TRUE(h.scheduler.try_commit().ok());
  EXPECT_EQ(h.scheduler.commit_index(), 2);
  EXPECT_TRUE(h.scheduler.done());
  EXPECT_EQ(h.scheduler.status_table().state(0), TransactionState::COMMITTED);
  EXPECT_EQ(h.scheduler.status_table().state(1), TransactionState::COMMITTED);
  EXPECT_EQ(h.scheduler.next_task().kind, TaskKind::kDone);
}

TEST(SchedulerTest, CommitWaitsForLowerIndex) {
  Harness h(2);
  h.expect_execute();
  h.expect_execute();

  ASSERT_TRUE(h.scheduler.finish_execution(TxnVersion(1, 0), {}, {}, Outcome::Success()).ok());
  ASSERT_TRUE(h.scheduler.try_commit().ok());
  EXPECT_EQ(h.scheduler.commit_index(), 0);

  ASSERT_TRUE(h.scheduler.finish_execution(TxnVersion(0, 0), {}, {}, Outcome::Success()).ok());
  ASSERT_TRUE(h.scheduler.try_commit().ok());
  EXPECT_EQ(h.scheduler.commit_index(), 2);
}

TEST(SchedulerTest, NoTaskWhileEverythingIsRunning) {
  Harness h(1);
  h.expect_execute();
  EXPECT_EQ(h.scheduler.next_task().kind, TaskKind::kNone);
}

// ─────────────────────────────────────────────────────────────────────────────
// Dependencies
// ─────────────────────────────────────────────────────────────────────────────

TEST(SchedulerTest, BlockedTransactionWaitsForWriter) {
  Harness h(2);
  h.expect_execute();
  h.expect_execute();

  ASSERT_TRUE(h.scheduler.on_blocked(TxnVersion(1, 0), 0).ok());
  EXPECT_EQ(h.scheduler.status_table().state(1), TransactionState::PENDING);
  EXPECT_EQ(h.scheduler.status_table().incarnation(1), 1);
  EXPECT_EQ(h.scheduler.status_table().blocked_on(1), 0);
  EXPECT_EQ(h.scheduler.next_task().kind, TaskKind::kNone);

  ASSERT_TRUE(h.scheduler.finish_execution(TxnVersion(0, 0), {}, {{"A", "1"}},
                                           Outcome::Success()).ok());
  EXPECT_EQ(h.scheduler.status_table().blocked_on(1), INVALID_TXN_IDX);
  EXPECT_EQ(h.expect_execute(), TxnVersion(1, 1));
  EXPECT_EQ(h.scheduler.metrics().dependency_waits, 1);
}

TEST(SchedulerTest, BlockedOnExecutedWriterIsReadyAtOnce) {
  Harness h(2);
  h.expect_execute();
  h.expect_execute();

  ASSERT_TRUE(h.scheduler.finish_execution(TxnVersion(0, 0), {}, {}, Outcome::Success()).ok());
  ASSERT_TRUE(h.scheduler.on_blocked(TxnVersion(1, 0), 0).ok());
  EXPECT_EQ(h.expect_execute(), TxnVersion(1, 1));
}

TEST(SchedulerTest, AbortStormIsFlagged) {
  EngineOptions options;
  options.abort_storm_threshold = 1;
  Harness h(2, options);
  h.expect_execute();
  h.expect_execute();

  ASSERT_TRUE(h.scheduler.on_blocked(TxnVersion(1, 0), 0).ok());
  EXPECT_FALSE(h.scheduler.metrics().abort_storm);

  ASSERT_TRUE(h.scheduler.finish_execution(TxnVersion(0, 0), {}, {}, Outcome::Success()).ok());
  EXPECT_EQ(h.expect_execute(), TxnVersion(1, 1));
  ASSERT_TRUE(h.scheduler.on_blocked(TxnVersion(1, 1), 0).ok());

  ExecutionMetrics metrics = h.scheduler.metrics();
  EXPECT_TRUE(metrics.abort_storm);
  EXPECT_EQ(metrics.max_incarnation, 2);
  EXPECT_EQ(metrics.dependency_waits, 2);
}

// ─────────────────────────────────────────────────────────────────────────────
// Validation
// ─────────────────────────────────────────────────────────────────────────────

TEST(SchedulerTest, SpeculativeValidationAbortsStaleReader) {
  Harness h(2);
  h.expect_execute();
  h.expect_execute();

  ASSERT_TRUE(h.scheduler.finish_execution(TxnVersion(1, 0), {ReadDescriptor::from_storage("A")},
                                           {{"B", "7"}}, Outcome::Success()).ok());
  ASSERT_TRUE(h.scheduler.finish_execution(TxnVersion(0, 0), {}, {{"A", "1"}},
                                           Outcome::Success()).ok());

  Task task = h.scheduler.next_task();
  ASSERT_EQ(task.kind, TaskKind::kValidate);
  EXPECT_EQ(task.version.txn_idx, 0);
  ASSERT_TRUE(h.scheduler.validate(task.record).ok());

  task = h.scheduler.next_task();
  ASSERT_EQ(task.kind, TaskKind::kValidate);
  EXPECT_EQ(task.version, TxnVersion(1, 0));
  ASSERT_TRUE(h.scheduler.validate(task.record).ok());

  EXPECT_EQ(h.scheduler.metrics().validation_aborts, 1);
  EXPECT_EQ(h.scheduler.status_table().state(1), TransactionState::PENDING);
  EXPECT_EQ(h.store.read("B", 2).status, VersionReadStatus::kEstimate);
  EXPECT_EQ(h.expect_execute(), TxnVersion(1, 1));
}

TEST(SchedulerTest, LastWinsAbortLeavesValue) {
  EngineOptions options;
  options.commit_race = CommitRacePolicy::kLastWins;
  Harness h(2, options);
  h.expect_execute();
  h.expect_execute();

  ASSERT_TRUE(h.scheduler.finish_execution(TxnVersion(1, 0), {ReadDescriptor::from_storage("A")},
                                           {{"B", "7"}}, Outcome::Success()).ok());
  ASSERT_TRUE(h.scheduler.finish_execution(TxnVersion(0, 0), {}, {{"A", "1"}},
                                           Outcome::Success()).ok());
  ASSERT_TRUE(h.scheduler.try_commit().ok());

  EXPECT_EQ(h.scheduler.commit_index(), 1);
  VersionRead read = h.store.read("B", 2);
  EXPECT_EQ(read.status, VersionReadStatus::kVersion);
  EXPECT_EQ(read.value, "7");
}

TEST(SchedulerTest, CommitFrontierRevalidates) {
  Harness h(2);
  h.expect_execute();
  h.expect_execute();

  ASSERT_TRUE(h.scheduler.finish_execution(TxnVersion(1, 0), {ReadDescriptor::from_storage("A")},
                                           {{"B", "1"}}, Outcome::Success()).ok());
  ASSERT_TRUE(h.scheduler.finish_execution(TxnVersion(0, 0), {}, {{"A", "1"}},
                                           Outcome::Success()).ok());

  ASSERT_TRUE(h.scheduler.try_commit().ok());
  EXPECT_EQ(h.scheduler.commit_index(), 1);
  EXPECT_EQ(h.scheduler.status_table().incarnation(1), 1);

  EXPECT_EQ(h.expect_execute(), TxnVersion(1, 1));
  ASSERT_TRUE(h.scheduler.finish_execution(
      TxnVersion(1, 1), {ReadDescriptor::from_version("A", TxnVersion(0, 0))}, {{"B", "2"}},
      Outcome::Success()).ok());
  ASSERT_TRUE(h.scheduler.try_commit().ok());
  EXPECT_TRUE(h.scheduler.done());

  StateDelta delta;
  ASSERT_TRUE(h.store.snapshot(&delta).ok());
  EXPECT_EQ(delta["A"], "1");
  EXPECT_EQ(delta["B"], "2");
}

TEST(SchedulerTest, ReexecutionRemovesKeysNoLongerWritten) {
  Harness h(2);
  h.expect_execute();
  h.expect_execute();

  ASSERT_TRUE(h.scheduler.finish_execution(TxnVersion(1, 0), {ReadDescriptor::from_storage("A")},
                                           {{"old", "1"}}, Outcome::Success()).ok());
  ASSERT_TRUE(h.scheduler.finish_execution(TxnVersion(0, 0), {}, {{"A", "1"}},
                                           Outcome::Success()).ok());
  ASSERT_TRUE(h.scheduler.try_commit().ok());

  EXPECT_EQ(h.expect_execute(), TxnVersion(1, 1));
  ASSERT_TRUE(h.scheduler.finish_execution(
      TxnVersion(1, 1), {ReadDescriptor::from_version("A", TxnVersion(0, 0))}, {{"new", "1"}},
      Outcome::Success()).ok());
  ASSERT_TRUE(h.scheduler.try_commit().ok());

  StateDelta delta;
  ASSERT_TRUE(h.store.snapshot(&delta).ok());
  EXPECT_EQ(delta.count("old"), 0);
  EXPECT_EQ(delta.count("new"), 1);
}

// ─────────────────────────────────────────────────────────────────────────────
// Commit Race
// ─────────────────────────────────────────────────────────────────────────────

TEST(SchedulerTest, RaceLostRollsBackAndRetries) {
  Harness h(2);
  h.expect_execute();
  h.expect_execute();
  ASSERT_TRUE(h.scheduler.finish_execution(TxnVersion(0, 0), {}, {}, Outcome::Success()).ok());
  ASSERT_TRUE(h.scheduler.on_blocked(TxnVersion(1, 0), 0).ok());

  // A value of the previous incarnation that nobody retracted
  ASSERT_EQ(h.store.write("B", TxnVersion(1, 0), "stale", CommitRacePolicy::kFirstWins),
            WriteOutcome::kInstalled);

  EXPECT_EQ(h.expect_execute(), TxnVersion(1, 1));
  ASSERT_TRUE(h.scheduler.finish_execution(TxnVersion(1, 1), {}, {{"B", "fresh"}},
                                           Outcome::Success()).ok());

  EXPECT_EQ(h.scheduler.metrics().race_losses, 1);
  EXPECT_EQ(h.scheduler.status_table().incarnation(1), 2);
  EXPECT_EQ(h.store.read("B", 2).status, VersionReadStatus::kEstimate);

  EXPECT_EQ(h.expect_execute(), TxnVersion(1, 2));
  ASSERT_TRUE(h.scheduler.finish_execution(TxnVersion(1, 2), {}, {{"B", "fresh"}},
                                           Outcome::Success()).ok());
  ASSERT_TRUE(h.scheduler.try_commit().ok());
  EXPECT_TRUE(h.scheduler.done());

  StateDelta delta;
  ASSERT_TRUE(h.store.snapshot(&delta).ok());
  EXPECT_EQ(delta["B"], "fresh");
}

// ─────────────────────────────────────────────────────────────────────────────
// Rescheduling
// ─────────────────────────────────────────────────────────────────────────────

TEST(SchedulerTest, DeferredRetryWaitsForInFlightWriter) {
  EngineOptions options;
  options.enable_rescheduling = true;
  options.early_detection = false;
  LocalityHints hints(3);
  hints[0].write_keys = {"X"};
  hints[1].read_keys = {"X"};
  hints[1].write_keys = {"A"};
  hints[2].read_keys = {"A"};
  hints[2].write_keys = {"C"};
  Harness h(3, options, hints);

  h.expect_execute();
  h.expect_execute();
  h.expect_execute();

  ASSERT_TRUE(h.scheduler.finish_execution(TxnVersion(1, 0), {ReadDescriptor::from_storage("X")},
                                           {{"A", "1"}}, Outcome::Success()).ok());
  ASSERT_TRUE(h.scheduler.finish_execution(
      TxnVersion(2, 0), {ReadDescriptor::from_version("A", TxnVersion(1, 0))}, {{"C", "2"}},
      Outcome::Success()).ok());
  ASSERT_TRUE(h.scheduler.finish_execution(TxnVersion(0, 0), {}, {{"X", "0"}},
                                           Outcome::Success()).ok());

  // Txn 0 validates, txn 1 fails (it read X before txn 0 wrote it)
  for (txn_idx_t expected : {0u, 1u}) {
    Task task = h.scheduler.next_task();
    ASSERT_EQ(task.kind, TaskKind::kValidate);
    ASSERT_EQ(task.version.txn_idx, expected);
    ASSERT_TRUE(h.scheduler.validate(task.record).ok());
  }

  // Txn 1 starts over; txn 2 now fails and has to wait for it
  EXPECT_EQ(h.expect_execute(), TxnVersion(1, 1));
  Task task = h.scheduler.next_task();
  ASSERT_EQ(task.kind, TaskKind::kValidate);
  ASSERT_EQ(task.version.txn_idx, 2);
  ASSERT_TRUE(h.scheduler.validate(task.record).ok());

  EXPECT_EQ(h.scheduler.status_table().blocked_on(2), 1);
  EXPECT_EQ(h.scheduler.metrics().deferred_retries, 1);
  EXPECT_EQ(h.scheduler.next_task().kind, TaskKind::kNone);

  ASSERT_TRUE(h.scheduler.finish_execution(
      TxnVersion(1, 1), {ReadDescriptor::from_version("X", TxnVersion(0, 0))}, {{"A", "1"}},
      Outcome::Success()).ok());
  EXPECT_EQ(h.expect_execute(), TxnVersion(2, 1));
}

TEST(SchedulerTest, PrepareMarksDeclaredWrites) {
  EngineOptions options;
  options.enable_rescheduling = true;
  LocalityHints hints(2);
  hints[0].write_keys = {"A"};
  hints[1].read_keys = {"A"};
  Harness h(2, options, hints);

  h.scheduler.prepare();
  VersionRead read = h.store.read("A", 1);
  EXPECT_EQ(read.status, VersionReadStatus::kEstimate);
  EXPECT_EQ(read.version.txn_idx, 0);

  // The first execution does not write A after all
  h.expect_execute();
  ASSERT_TRUE(h.scheduler.finish_execution(TxnVersion(0, 0), {}, {}, Outcome::Success()).ok());
  EXPECT_EQ(h.store.read("A", 1).status, VersionReadStatus::kAbsent);
}

TEST(SchedulerTest, PrepareIsNoopWithoutEarlyDetection) {
  EngineOptions options;
  options.enable_rescheduling = true;
  options.early_detection = false;
  LocalityHints hints(1);
  hints[0].write_keys = {"A"};
  Harness h(1, options, hints);

  h.scheduler.prepare();
  EXPECT_EQ(h.store.key_count(), 0);
}

// ─────────────────────────────────────────────────────────────────────────────
// Invariant Violations
// ─────────────────────────────────────────────────────────────────────────────

TEST(SchedulerTest, FinishingStaleIncarnationHalts) {
  Harness h(2);
  h.expect_execute();

  Status status = h.scheduler.finish_execution(TxnVersion(0, 3), {}, {}, Outcome::Success());
  EXPECT_TRUE(status.is_internal());
  EXPECT_TRUE(h.scheduler.halted());
  EXPECT_TRUE(h.scheduler.done());
  EXPECT_TRUE(h.scheduler.halt_status().is_internal());
  EXPECT_EQ(h.scheduler.next_task().kind, TaskKind::kDone);
}

TEST(SchedulerTest, DependencyOnHigherIndexHalts) {
  Harness h(2);
  h.expect_execute();
  h.expect_execute();

  EXPECT_TRUE(h.scheduler.on_blocked(TxnVersion(0, 0), 1).is_internal());
  EXPECT_TRUE(h.scheduler.halted());
}

TEST(SchedulerTest, FirstHaltStatusWins) {
  Harness h(1);
  h.scheduler.halt(Status::Internal("first"));
  h.scheduler.halt(Status::ResourceExhausted("second"));
  EXPECT_EQ(h.scheduler.halt_status().message(), "first");
}

}  // namespace
}  // namespace tessera
