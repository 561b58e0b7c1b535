#include "paycore/replay/replay_driver.hpp"

#include <string>
#include <utility>

#include "paycore/common/logger.hpp"

namespace paycore {
namespace replay {

std::optional<ErrorPolicy> parse_error_policy(std::string_view text) noexcept {
  if (text == "halt") {
    return ErrorPolicy::kHalt;
  }
  if (text == "skip") {
    return ErrorPolicy::kSkip;
  }
  return std::nullopt;
}

Driver::Driver(ledger::LedgerState& ledger) : ledger_(ledger) {}

void Driver::configure(ErrorPolicy policy) {
  policy_ = policy;
}

void Driver::set_reject_handler(RejectHandler handler) {
  reject_handler_ = std::move(handler);
}

Summary Driver::execute(ingest::CsvReader& reader) {
  Summary summary;
  common::TransactionRecord record;

  while (reader.next(record)) {
    ++summary.records_read;
    PAYCORE_LOG_DEBUG("line ", reader.line(), ": ", common::to_string(record.kind), " client=",
                      record.client, " tx=", record.tx, " amount=",
                      record.amount ? std::to_string(*record.amount) : std::string("-"));

    const auto result = ledger_.apply(record);
    if (result.ok()) {
      ++summary.applied;
      continue;
    }

    ++summary.rejected;
    if (reject_handler_) {
      reject_handler_(reader.line(), result);
    }
    if (policy_ == ErrorPolicy::kHalt) {
      summary.halted_on = result;
      summary.halted_line = reader.line();
      break;
    }
    PAYCORE_LOG_WARN("line ", reader.line(), ": skipped, ", ledger::describe(result));
  }

  return summary;
}

}  // namespace replay
}  // namespace paycore
