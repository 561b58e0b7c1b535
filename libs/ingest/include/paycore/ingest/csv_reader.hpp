#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "paycore/common/types.hpp"

namespace paycore {
namespace ingest {

// Malformed header or row. `line()` is 1-based and counts the header.
class FormatError : public std::runtime_error {
 public:
  FormatError(std::uint64_t line, const std::string& message);

  [[nodiscard]] std::uint64_t line() const noexcept { return line_; }

 private:
  std::uint64_t line_;
};

// Splits one line into trimmed fields. Double quotes group a field and `""`
// inside quotes is a literal quote. Throws std::invalid_argument on an
// unterminated quote.
[[nodiscard]] std::vector<std::string> split_fields(std::string_view line, char delimiter);

// Empty, or not a number, yields no amount.
[[nodiscard]] std::optional<double> parse_amount(std::string_view text) noexcept;

// Forward-only reader of `type,client,tx,amount` rows.
class CsvReader {
 public:
  explicit CsvReader(const std::filesystem::path& path, char delimiter = ',');
  explicit CsvReader(std::istream& input, char delimiter = ',');
  CsvReader(const CsvReader&) = delete;
  CsvReader& operator=(const CsvReader&) = delete;
  CsvReader(CsvReader&&) = delete;
  CsvReader& operator=(CsvReader&&) = delete;

  // False at end of input.
  bool next(common::TransactionRecord& out_record);
  [[nodiscard]] std::uint64_t line() const noexcept { return line_; }

 private:
  struct Columns {
    std::size_t type{0};
    std::size_t client{0};
    std::size_t tx{0};
    std::optional<std::size_t> amount{};
    std::size_t count{0};
  };

  std::ifstream file_{};
  std::istream* input_{nullptr};
  char delimiter_;
  std::uint64_t line_{0};
  Columns columns_{};

  bool read_line(std::string& out_line);
  void read_header();
  [[nodiscard]] common::TransactionRecord parse_row(const std::vector<std::string>& fields) const;
};

}  // namespace ingest
}  // namespace paycore
