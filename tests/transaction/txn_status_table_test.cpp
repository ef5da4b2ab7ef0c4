/**
 * @file txn_status_table_test.cpp
 * @brief Unit tests for TransactionStatusTable
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>

#include "transaction/txn_status_table.hpp"

namespace tessera {
namespace {

TEST(TxnStatusTableTest, InitialState) {
  TransactionStatusTable table(3);

  EXPECT_EQ(table.size(), 3);
  for (txn_idx_t i = 0; i < 3; ++i) {
    EXPECT_EQ(table.state(i), TransactionState::PENDING);
    EXPECT_EQ(table.incarnation(i), INITIAL_INCARNATION);
    EXPECT_EQ(table.blocked_on(i), INVALID_TXN_IDX);
    EXPECT_EQ(table.record(i), nullptr);
    EXPECT_FALSE(table.has_executed(i));
  }
}

TEST(TxnStatusTableTest, BeginExecutionOnlyOnce) {
  TransactionStatusTable table(2);

  TxnVersion version;
  ASSERT_TRUE(table.try_begin_execution(1, &version));
  EXPECT_EQ(version, TxnVersion(1, 0));
  EXPECT_EQ(table.state(1), TransactionState::EXECUTING);

  EXPECT_FALSE(table.try_begin_execution(1, &version));
}

TEST(TxnStatusTableTest, BlockedTransactionIsNotReady) {
  TransactionStatusTable table(2);
  {
    TxnSlot& slot = table.slot(1);
    std::lock_guard<std::mutex> lock(slot.mutex);
    slot.blocked_on = 0;
    slot.incarnation = 1;
  }

  TxnVersion version;
  EXPECT_FALSE(table.try_begin_execution(1, &version));
  EXPECT_EQ(table.blocked_on(1), 0);
}

TEST(TxnStatusTableTest, BeginValidationNeedsExecutedRecord) {
  TransactionStatusTable table(1);
  ExecutionRecordPtr record;
  EXPECT_FALSE(table.try_begin_validation(0, &record));

  auto executed = std::make_shared<ExecutionRecord>();
  executed->version = TxnVersion(0, 0);
  {
    TxnSlot& slot = table.slot(0);
    std::lock_guard<std::mutex> lock(slot.mutex);
    slot.state = TransactionState::EXECUTED;
    slot.record = executed;
  }

  EXPECT_TRUE(table.has_executed(0));
  ASSERT_TRUE(table.try_begin_validation(0, &record));
  EXPECT_EQ(record, executed);
  EXPECT_EQ(table.state(0), TransactionState::VALIDATING);
  EXPECT_TRUE(table.has_executed(0));
  EXPECT_FALSE(table.try_begin_validation(0, &record));
}

TEST(TxnStatusTableTest, ExecutedStates) {
  EXPECT_FALSE(TransactionStatusTable::is_executed_state(TransactionState::PENDING));
  EXPECT_FALSE(TransactionStatusTable::is_executed_state(TransactionState::EXECUTING));
  EXPECT_FALSE(TransactionStatusTable::is_executed_state(TransactionState::ABORTING));
  EXPECT_TRUE(TransactionStatusTable::is_executed_state(TransactionState::EXECUTED));
  EXPECT_TRUE(TransactionStatusTable::is_executed_state(TransactionState::VALIDATING));
  EXPECT_TRUE(TransactionStatusTable::is_executed_state(TransactionState::COMMITTED));
}

TEST(TxnStatusTableTest, StateToString) {
  EXPECT_STREQ(transaction_state_to_string(TransactionState::PENDING), "PENDING");
  EXPECT_STREQ(transaction_state_to_string(TransactionState::EXECUTING), "EXECUTING");
  EXPECT_STREQ(transaction_state_to_string(TransactionState::EXECUTED), "EXECUTED");
  EXPECT_STREQ(transaction_state_to_string(TransactionState::ABORTING), "ABORTING");
  EXPECT_STREQ(transaction_state_to_string(TransactionState::VALIDATING), "VALIDATING");
  EXPECT_STREQ(transaction_state_to_string(TransactionState::COMMITTED), "COMMITTED");
}

TEST(ExecutionRecordTest, WriteKeys) {
  ExecutionRecord record;
  record.writes = {{"A", "1"}, {"B", "2"}};

  auto keys = record.write_keys();
  std::sort(keys.begin(), keys.end());
  ASSERT_EQ(keys.size(), 2);
  EXPECT_EQ(keys[0], "A");
  EXPECT_EQ(keys[1], "B");
}

}  // namespace
}  // namespace tessera
