#pragma once

namespace paycore::tests {

void test_ledger_deposit();
void test_ledger_invalid_deposit();
void test_ledger_amount_overflow();
void test_ledger_amount_overflow_with_held_funds();
void test_ledger_withdrawal();
void test_ledger_invalid_withdrawal();
void test_ledger_insufficient_funds();
void test_ledger_dispute_then_resolve();
void test_ledger_dispute_then_chargeback();
void test_ledger_resolve_not_disputed();
void test_ledger_duplicate_transaction();
void test_ledger_unknown_transaction();
void test_ledger_export_order();

}  // namespace paycore::tests
