#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>

#include "paycore/ingest/csv_reader.hpp"
#include "paycore/ledger/ledger_state.hpp"

namespace paycore {
namespace replay {

enum class ErrorPolicy : std::uint8_t {
  kHalt,  // stop at the first rejected record
  kSkip,  // report the rejection and keep going
};

[[nodiscard]] std::optional<ErrorPolicy> parse_error_policy(std::string_view text) noexcept;

struct Summary {
  std::uint64_t records_read{0};
  std::uint64_t applied{0};
  std::uint64_t rejected{0};
  std::optional<ledger::ApplyResult> halted_on{};
  std::uint64_t halted_line{0};

  [[nodiscard]] bool halted() const noexcept { return halted_on.has_value(); }
};

// Feeds every record of a reader into one ledger, in order. Format and I/O
// errors raised by the reader propagate to the caller.
class Driver {
 public:
  using RejectHandler = std::function<void(std::uint64_t line, const ledger::ApplyResult&)>;

  explicit Driver(ledger::LedgerState& ledger);

  void configure(ErrorPolicy policy);
  void set_reject_handler(RejectHandler handler);
  Summary execute(ingest::CsvReader& reader);

 private:
  ledger::LedgerState& ledger_;
  ErrorPolicy policy_{ErrorPolicy::kHalt};
  RejectHandler reject_handler_{};
};

}  // namespace replay
}  // namespace paycore
