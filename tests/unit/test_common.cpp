#include "test_common.hpp"

#include <cassert>
#include <sstream>
#include <string>

#include "paycore/common/logger.hpp"
#include "paycore/common/types.hpp"

namespace paycore::tests {

void test_transaction_kind_names() {
  using common::TransactionKind;

  assert(common::parse_transaction_kind("deposit") == TransactionKind::kDeposit);
  assert(common::parse_transaction_kind("  Withdrawal ") == TransactionKind::kWithdrawal);
  assert(common::parse_transaction_kind("DISPUTE") == TransactionKind::kDispute);
  assert(common::parse_transaction_kind("resolve") == TransactionKind::kResolve);
  assert(common::parse_transaction_kind("ChargeBack") == TransactionKind::kChargeback);
  assert(!common::parse_transaction_kind("refund").has_value());
  assert(!common::parse_transaction_kind("").has_value());

  assert(common::to_string(TransactionKind::kChargeback) == "chargeback");
}

void test_log_levels() {
  assert(common::parse_log_level("DEBUG") == common::LogLevel::kDebug);
  assert(common::parse_log_level("warn") == common::LogLevel::kWarning);
  assert(common::parse_log_level("error") == common::LogLevel::kError);
  assert(common::parse_log_level("WARNING") == common::LogLevel::kWarning);
  assert(common::parse_log_level("Info") == common::LogLevel::kInfo);
  assert(!common::parse_log_level("verbose").has_value());
  assert(!common::parse_log_level("de bug").has_value());
  assert(!common::parse_log_level(" debug").has_value());

  auto& logger = common::Logger::instance();
  const auto previous = logger.level();
  std::ostringstream sink;
  logger.set_stream(&sink);
  logger.set_level(common::LogLevel::kWarning);

  PAYCORE_LOG_INFO("hidden ", 1);
  PAYCORE_LOG_WARN("shown ", 2);

  const auto text = sink.str();
  assert(text.find("hidden") == std::string::npos);
  assert(text.find("[warning] shown 2") != std::string::npos);

  logger.set_stream(nullptr);
  logger.set_level(previous);
}

}  // namespace paycore::tests
