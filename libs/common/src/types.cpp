#include "paycore/common/types.hpp"

#include <array>
#include <cctype>
#include <utility>

namespace paycore {
namespace common {

namespace {

constexpr std::array<std::pair<std::string_view, TransactionKind>, 5> kKindNames{{
    {"deposit", TransactionKind::kDeposit},
    {"withdrawal", TransactionKind::kWithdrawal},
    {"dispute", TransactionKind::kDispute},
    {"resolve", TransactionKind::kResolve},
    {"chargeback", TransactionKind::kChargeback},
}};

std::string_view trim(std::string_view text) noexcept {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
    text.remove_suffix(1);
  }
  return text;
}

bool iequals(std::string_view lhs, std::string_view rhs) noexcept {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(lhs[i])) !=
        std::tolower(static_cast<unsigned char>(rhs[i]))) {
      return false;
    }
  }
  return true;
}

}  // namespace

std::string_view to_string(TransactionKind kind) noexcept {
  for (const auto& [name, value] : kKindNames) {
    if (value == kind) {
      return name;
    }
  }
  return "unknown";
}

std::optional<TransactionKind> parse_transaction_kind(std::string_view text) noexcept {
  const auto trimmed = trim(text);
  for (const auto& [name, value] : kKindNames) {
    if (iequals(trimmed, name)) {
      return value;
    }
  }
  return std::nullopt;
}

}  // namespace common
}  // namespace paycore
