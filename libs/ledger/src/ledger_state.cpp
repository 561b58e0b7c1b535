#include "paycore/ledger/ledger_state.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace paycore {
namespace ledger {

namespace {

ApplyResult make_result(Status status, const common::TransactionRecord& record) {
  return ApplyResult{
      .status = status,
      .client = record.client,
      .tx = record.tx,
      .amount = record.amount,
  };
}

bool valid_amount(const std::optional<double>& amount) noexcept {
  return amount && std::isfinite(*amount) && *amount > 0.0;
}

}  // namespace

ApplyResult LedgerState::apply(const common::TransactionRecord& record) {
  ensure_account(record.client);

  switch (record.kind) {
    case common::TransactionKind::kDeposit:
      return deposit(record);
    case common::TransactionKind::kWithdrawal:
      return withdraw(record);
    case common::TransactionKind::kDispute:
      return dispute(record);
    case common::TransactionKind::kResolve:
      return resolve(record);
    case common::TransactionKind::kChargeback:
      return chargeback(record);
  }
  return make_result(Status::kUnknownTransaction, record);
}

std::vector<AccountSnapshot> LedgerState::export_accounts() const {
  std::vector<AccountSnapshot> snapshots;
  snapshots.reserve(accounts_.size());
  for (const auto& [client, state] : accounts_) {
    snapshots.push_back(AccountSnapshot{.client = client, .state = state});
  }
  std::sort(snapshots.begin(), snapshots.end(),
            [](const AccountSnapshot& lhs, const AccountSnapshot& rhs) {
              return lhs.client < rhs.client;
            });
  return snapshots;
}

const AccountState* LedgerState::find_account(common::ClientId client) const {
  if (auto it = accounts_.find(client); it != accounts_.end()) {
    return &it->second;
  }
  return nullptr;
}

const HistoryEntry* LedgerState::find_entry(common::TxId tx) const {
  if (auto it = history_.find(tx); it != history_.end()) {
    return &it->second;
  }
  return nullptr;
}

AccountState& LedgerState::ensure_account(common::ClientId client) {
  return accounts_.try_emplace(client).first->second;
}

AccountState* LedgerState::mutable_account(common::ClientId client) {
  if (auto it = accounts_.find(client); it != accounts_.end()) {
    return &it->second;
  }
  return nullptr;
}

std::optional<ApplyResult> LedgerState::check_funds_movement(const common::TransactionRecord& record,
                                                             const AccountState& account) const {
  if (history_.contains(record.tx)) {
    return make_result(Status::kDuplicateTransaction, record);
  }
  if (!valid_amount(record.amount)) {
    return make_result(Status::kInvalidAmount, record);
  }
  if (account.locked) {
    return make_result(Status::kAccountLocked, record);
  }
  return std::nullopt;
}

void LedgerState::remember(const common::TransactionRecord& record) {
  history_.emplace(record.tx, HistoryEntry{.record = record, .under_dispute = false});
}

ApplyResult LedgerState::deposit(const common::TransactionRecord& record) {
  auto* account = mutable_account(record.client);
  if (!account) {
    return make_result(Status::kUnknownClient, record);
  }
  if (auto rejected = check_funds_movement(record, *account)) {
    return *rejected;
  }

  const double amount = *record.amount;
  const double previous_available = account->available;
  const double previous_total = account->total;
  account->available += amount;
  account->total += amount;

  // The addition was absorbed by the magnitude of one of the sums. Both
  // sums keep whatever the addition left them with, so `available` may
  // already carry the amount while `total` does not. The deposit is not
  // recorded.
  if (account->available == previous_available || account->total == previous_total) {
    return make_result(Status::kAmountOverflow, record);
  }

  remember(record);
  return make_result(Status::kOk, record);
}

ApplyResult LedgerState::withdraw(const common::TransactionRecord& record) {
  auto* account = mutable_account(record.client);
  if (!account) {
    return make_result(Status::kUnknownClient, record);
  }
  if (auto rejected = check_funds_movement(record, *account)) {
    return *rejected;
  }

  const double amount = *record.amount;
  if (amount > account->available) {
    return make_result(Status::kInsufficientFunds, record);
  }
  account->available -= amount;
  account->total -= amount;

  remember(record);
  return make_result(Status::kOk, record);
}

ApplyResult LedgerState::dispute(const common::TransactionRecord& record) {
  auto* account = mutable_account(record.client);
  if (!account) {
    return make_result(Status::kUnknownClient, record);
  }
  auto it = history_.find(record.tx);
  if (it == history_.end()) {
    return make_result(Status::kUnknownTransaction, record);
  }

  auto& entry = it->second;
  const double amount = entry.record.amount_or_zero();
  account->available -= amount;
  account->held += amount;
  entry.under_dispute = true;
  return make_result(Status::kOk, record);
}

ApplyResult LedgerState::resolve(const common::TransactionRecord& record) {
  auto* account = mutable_account(record.client);
  if (!account) {
    return make_result(Status::kUnknownClient, record);
  }
  auto it = history_.find(record.tx);
  if (it == history_.end()) {
    return make_result(Status::kUnknownTransaction, record);
  }

  auto& entry = it->second;
  if (!entry.under_dispute) {
    return make_result(Status::kNotDisputed, record);
  }
  const double amount = entry.record.amount_or_zero();
  account->held -= amount;
  account->available += amount;
  entry.under_dispute = false;
  return make_result(Status::kOk, record);
}

ApplyResult LedgerState::chargeback(const common::TransactionRecord& record) {
  auto* account = mutable_account(record.client);
  if (!account) {
    return make_result(Status::kUnknownClient, record);
  }
  auto it = history_.find(record.tx);
  if (it == history_.end()) {
    return make_result(Status::kUnknownTransaction, record);
  }

  auto& entry = it->second;
  if (!entry.under_dispute) {
    return make_result(Status::kNotDisputed, record);
  }
  const double amount = entry.record.amount_or_zero();
  account->held -= amount;
  account->total -= amount;
  account->locked = true;
  entry.under_dispute = false;
  return make_result(Status::kOk, record);
}

std::string_view to_string(Status status) noexcept {
  switch (status) {
    case Status::kOk:
      return "ok";
    case Status::kUnknownClient:
      return "unknown_client";
    case Status::kUnknownTransaction:
      return "unknown_transaction";
    case Status::kInvalidAmount:
      return "invalid_amount";
    case Status::kAmountOverflow:
      return "amount_overflow";
    case Status::kInsufficientFunds:
      return "insufficient_funds";
    case Status::kNotDisputed:
      return "not_disputed";
    case Status::kAccountLocked:
      return "account_locked";
    case Status::kDuplicateTransaction:
      return "duplicate_transaction";
  }
  return "unknown";
}

std::string describe(const ApplyResult& result) {
  std::ostringstream oss;
  switch (result.status) {
    case Status::kOk:
      oss << "tx " << result.tx << " applied to client " << result.client;
      break;
    case Status::kUnknownClient:
      oss << "unknown client " << result.client;
      break;
    case Status::kUnknownTransaction:
      oss << "unknown transaction " << result.tx;
      break;
    case Status::kInvalidAmount:
      if (result.amount) {
        oss << "invalid amount " << *result.amount << " for tx " << result.tx;
      } else {
        oss << "missing amount for tx " << result.tx;
      }
      break;
    case Status::kAmountOverflow:
      oss << "balance of client " << result.client << " is too large to absorb tx " << result.tx;
      break;
    case Status::kInsufficientFunds:
      oss << "insufficient funds for client " << result.client << " to withdraw "
          << result.amount.value_or(0.0) << " (tx " << result.tx << ")";
      break;
    case Status::kNotDisputed:
      oss << "transaction " << result.tx << " is not disputed";
      break;
    case Status::kAccountLocked:
      oss << "account of client " << result.client << " is locked (tx " << result.tx << ")";
      break;
    case Status::kDuplicateTransaction:
      oss << "duplicate transaction " << result.tx;
      break;
  }
  return oss.str();
}

}  // namespace ledger
}  // namespace paycore
