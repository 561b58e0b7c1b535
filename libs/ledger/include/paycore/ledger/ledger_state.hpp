#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "paycore/common/types.hpp"

namespace paycore {
namespace ledger {

enum class Status : std::uint8_t {
  kOk,
  kUnknownClient,
  kUnknownTransaction,
  kInvalidAmount,
  kAmountOverflow,
  kInsufficientFunds,
  kNotDisputed,
  kAccountLocked,
  kDuplicateTransaction,
};

struct ApplyResult {
  Status status{Status::kOk};
  common::ClientId client{0};
  common::TxId tx{0};
  std::optional<double> amount{};

  [[nodiscard]] bool ok() const noexcept { return status == Status::kOk; }
};

struct AccountState {
  double available{0.0};
  double held{0.0};
  double total{0.0};
  bool locked{false};
};

// Stored copy of an applied deposit or withdrawal.
struct HistoryEntry {
  common::TransactionRecord record{};
  bool under_dispute{false};
};

struct AccountSnapshot {
  common::ClientId client{0};
  AccountState state{};
};

class LedgerState {
 public:
  // Creates the client's account if it does not exist yet, even when the
  // record is then rejected. A rejected record leaves state untouched except
  // for kAmountOverflow, which is detected after the deposit was added.
  [[nodiscard]] ApplyResult apply(const common::TransactionRecord& record);

  // Ordered by client id.
  [[nodiscard]] std::vector<AccountSnapshot> export_accounts() const;

  [[nodiscard]] const AccountState* find_account(common::ClientId client) const;
  [[nodiscard]] const HistoryEntry* find_entry(common::TxId tx) const;
  [[nodiscard]] std::size_t account_count() const noexcept { return accounts_.size(); }
  [[nodiscard]] std::size_t history_size() const noexcept { return history_.size(); }

 private:
  std::unordered_map<common::ClientId, AccountState> accounts_{};
  std::unordered_map<common::TxId, HistoryEntry> history_{};

  AccountState& ensure_account(common::ClientId client);
  AccountState* mutable_account(common::ClientId client);

  ApplyResult deposit(const common::TransactionRecord& record);
  ApplyResult withdraw(const common::TransactionRecord& record);
  ApplyResult dispute(const common::TransactionRecord& record);
  ApplyResult resolve(const common::TransactionRecord& record);
  ApplyResult chargeback(const common::TransactionRecord& record);

  // Shared duplicate/amount/locked checks for records that move funds.
  std::optional<ApplyResult> check_funds_movement(const common::TransactionRecord& record,
                                                  const AccountState& account) const;
  void remember(const common::TransactionRecord& record);
};

[[nodiscard]] std::string_view to_string(Status status) noexcept;
[[nodiscard]] std::string describe(const ApplyResult& result);

}  // namespace ledger
}  // namespace paycore
