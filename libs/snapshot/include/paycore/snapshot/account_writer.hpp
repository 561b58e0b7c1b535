#pragma once

#include <ostream>
#include <span>
#include <string>

#include "paycore/ledger/ledger_state.hpp"

namespace paycore {
namespace snapshot {

// Rounds half away from zero to `decimal_places`, then prints the shortest
// decimal that reads back as the rounded value. Never prints "-0".
[[nodiscard]] std::string format_amount(double value, int decimal_places);

class AccountWriter {
 public:
  struct Options {
    char delimiter{','};
    int decimal_places{4};
  };

  AccountWriter();
  explicit AccountWriter(Options options);

  void write(std::ostream& out, std::span<const ledger::AccountSnapshot> accounts) const;

 private:
  Options options_{};

  void write_header(std::ostream& out) const;
  void write_row(std::ostream& out, const ledger::AccountSnapshot& account) const;
};

}  // namespace snapshot
}  // namespace paycore
