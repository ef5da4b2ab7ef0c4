/**
 * @file txn_status_table.cpp
 * @brief Transaction status table implementation
 */

#include "transaction/txn_status_table.hpp"

namespace tessera {

TransactionStatusTable::TransactionStatusTable(size_t num_txns) {
    slots_.reserve(num_txns);
    for (size_t i = 0; i < num_txns; ++i) {
        slots_.push_back(std::make_unique<TxnSlot>());
    }
}

bool TransactionStatusTable::try_begin_execution(txn_idx_t idx, TxnVersion* version) {
    TxnSlot& s = *slots_[idx];
    std::lock_guard<std::mutex> lock(s.mutex);

    if (s.state != TransactionState::PENDING || s.blocked_on != INVALID_TXN_IDX) {
        return false;
    }
    s.state = TransactionState::EXECUTING;
    *version = TxnVersion(idx, s.incarnation);
    return true;
}

bool TransactionStatusTable::try_begin_validation(txn_idx_t idx, ExecutionRecordPtr* record) {
    TxnSlot& s = *slots_[idx];
    std::lock_guard<std::mutex> lock(s.mutex);

    if (s.state != TransactionState::EXECUTED || s.record == nullptr) {
        return false;
    }
    s.state = TransactionState::VALIDATING;
    *record = s.record;
    return true;
}

TransactionState TransactionStatusTable::state(txn_idx_t idx) const {
    TxnSlot& s = *slots_[idx];
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.state;
}

incarnation_t TransactionStatusTable::incarnation(txn_idx_t idx) const {
    TxnSlot& s = *slots_[idx];
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.incarnation;
}

txn_idx_t TransactionStatusTable::blocked_on(txn_idx_t idx) const {
    TxnSlot& s = *slots_[idx];
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.blocked_on;
}

ExecutionRecordPtr TransactionStatusTable::record(txn_idx_t idx) const {
    TxnSlot& s = *slots_[idx];
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.record;
}

bool TransactionStatusTable::has_executed(txn_idx_t idx) const {
    TxnSlot& s = *slots_[idx];
    std::lock_guard<std::mutex> lock(s.mutex);
    return is_executed_state(s.state);
}

}  // namespace tessera
