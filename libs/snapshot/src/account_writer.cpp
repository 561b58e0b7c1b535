#include "paycore/snapshot/account_writer.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <stdexcept>

#include "paycore/common/errors.hpp"

namespace paycore {
namespace snapshot {

namespace {

// Above this magnitude a double has no fractional digits left to round.
constexpr double kRoundingLimit = 1e15;

double round_to(double value, int decimal_places) {
  if (!std::isfinite(value) || std::fabs(value) >= kRoundingLimit) {
    return value;
  }
  const double scale = std::pow(10.0, decimal_places);
  return std::round(value * scale) / scale;
}

}  // namespace

std::string format_amount(double value, int decimal_places) {
  if (std::isnan(value)) {
    return "nan";
  }
  if (std::isinf(value)) {
    return value > 0 ? "inf" : "-inf";
  }

  double rounded = round_to(value, decimal_places);
  if (rounded == 0.0) {
    rounded = 0.0;
  }

  std::array<char, 64> buffer{};
  const auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), rounded);
  if (ec != std::errc{}) {
    throw std::runtime_error("failed to format amount");
  }
  return std::string(buffer.data(), ptr);
}

AccountWriter::AccountWriter() = default;

AccountWriter::AccountWriter(Options options) : options_(options) {}

void AccountWriter::write(std::ostream& out,
                          std::span<const ledger::AccountSnapshot> accounts) const {
  write_header(out);
  for (const auto& account : accounts) {
    write_row(out, account);
  }
  out.flush();
  if (!out) {
    throw common::IoError("failed to write account table");
  }
}

void AccountWriter::write_header(std::ostream& out) const {
  const char d = options_.delimiter;
  out << "client" << d << "available" << d << "held" << d << "total" << d << "locked" << '\n';
}

void AccountWriter::write_row(std::ostream& out, const ledger::AccountSnapshot& account) const {
  const char d = options_.delimiter;
  const int places = options_.decimal_places;
  out << account.client << d << format_amount(account.state.available, places) << d
      << format_amount(account.state.held, places) << d
      << format_amount(account.state.total, places) << d
      << (account.state.locked ? "true" : "false") << '\n';
}

}  // namespace snapshot
}  // namespace paycore
