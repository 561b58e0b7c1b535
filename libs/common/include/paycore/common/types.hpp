#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace paycore {
namespace common {

using ClientId = std::uint16_t;
using TxId = std::uint32_t;

enum class TransactionKind : std::uint8_t {
  kDeposit,
  kWithdrawal,
  kDispute,
  kResolve,
  kChargeback,
};

// One input event. Only deposits and withdrawals carry an amount.
struct TransactionRecord {
  TransactionKind kind{TransactionKind::kDeposit};
  ClientId client{};
  TxId tx{};
  std::optional<double> amount{};

  [[nodiscard]] double amount_or_zero() const noexcept { return amount.value_or(0.0); }
};

[[nodiscard]] std::string_view to_string(TransactionKind kind) noexcept;
[[nodiscard]] std::optional<TransactionKind> parse_transaction_kind(std::string_view text) noexcept;

}  // namespace common
}  // namespace paycore
