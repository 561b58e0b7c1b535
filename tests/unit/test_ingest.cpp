#include "test_ingest.hpp"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "paycore/common/errors.hpp"
#include "paycore/ingest/csv_reader.hpp"

namespace paycore::tests {

namespace {

// Reads every row; returns the number of records, or rethrows.
std::size_t count_rows(const std::string& text, char delimiter = ',') {
  std::istringstream input(text);
  ingest::CsvReader reader(input, delimiter);
  common::TransactionRecord record;
  std::size_t rows = 0;
  while (reader.next(record)) {
    ++rows;
  }
  return rows;
}

std::uint64_t format_error_line(const std::string& text) {
  try {
    count_rows(text);
  } catch (const ingest::FormatError& e) {
    return e.line();
  }
  assert(false && "expected a format error");
  return 0;
}

}  // namespace

void test_csv_reader_rows() {
  std::istringstream input(
      "type, client, tx, amount\n"
      "deposit, 1, 1, 1.0\n"
      "\n"
      "Withdrawal,  2 ,5,  +0.5 \r\n"
      "dispute, 1, 1,\n"
      "resolve, 1, 1\n"
      "chargeback,65535,4294967295,\n");
  ingest::CsvReader reader(input);
  common::TransactionRecord record;

  assert(reader.next(record));
  assert(reader.line() == 2);
  assert(record.kind == common::TransactionKind::kDeposit);
  assert(record.client == 1);
  assert(record.tx == 1);
  assert(record.amount == 1.0);

  assert(reader.next(record));
  assert(reader.line() == 4);
  assert(record.kind == common::TransactionKind::kWithdrawal);
  assert(record.client == 2);
  assert(record.tx == 5);
  assert(record.amount == 0.5);

  assert(reader.next(record));
  assert(record.kind == common::TransactionKind::kDispute);
  assert(!record.amount.has_value());

  assert(reader.next(record));
  assert(record.kind == common::TransactionKind::kResolve);
  assert(!record.amount.has_value());

  assert(reader.next(record));
  assert(record.kind == common::TransactionKind::kChargeback);
  assert(record.client == 65535);
  assert(record.tx == 4294967295u);

  assert(!reader.next(record));
  assert(!reader.next(record));
}

void test_csv_reader_header_variants() {
  // Column order follows the header; names ignore case and padding.
  std::istringstream reordered(" TX ;Amount; Client ;TYPE\n7;2.5;3;deposit\n");
  ingest::CsvReader reader(reordered, ';');
  common::TransactionRecord record;
  assert(reader.next(record));
  assert(record.tx == 7);
  assert(record.client == 3);
  assert(record.amount == 2.5);
  assert(record.kind == common::TransactionKind::kDeposit);

  // No amount column at all.
  std::istringstream no_amount("type,client,tx\ndispute,1,2\n");
  ingest::CsvReader short_reader(no_amount);
  assert(short_reader.next(record));
  assert(record.kind == common::TransactionKind::kDispute);
  assert(!record.amount.has_value());

  // Unparseable amounts are read as absent.
  std::istringstream bad_amount("type,client,tx,amount\ndeposit,1,2,abc\n");
  ingest::CsvReader amount_reader(bad_amount);
  assert(amount_reader.next(record));
  assert(!record.amount.has_value());

  assert(count_rows("type,client,tx,amount\n") == 0);

  // Spreadsheet exports start with a UTF-8 byte order mark.
  std::istringstream with_bom("\xEF\xBB\xBFtype,client,tx,amount\ndeposit,1,1,1.0\n");
  ingest::CsvReader bom_reader(with_bom);
  assert(bom_reader.next(record));
  assert(record.kind == common::TransactionKind::kDeposit);
  assert(record.client == 1);
  assert(record.amount == 1.0);
}

void test_csv_reader_format_errors() {
  assert(format_error_line("") == 1);
  assert(format_error_line("type,client,amount\n") == 1);
  assert(format_error_line("type,client,tx,amount\ndeposit,1,1,1.0\nrefund,1,2,1.0\n") == 3);
  assert(format_error_line("type,client,tx,amount\ndeposit,65536,1,1.0\n") == 2);
  assert(format_error_line("type,client,tx,amount\ndeposit,-1,1,1.0\n") == 2);
  assert(format_error_line("type,client,tx,amount\ndeposit,1,4294967296,1.0\n") == 2);
  assert(format_error_line("type,client,tx,amount\ndeposit,1,x,1.0\n") == 2);
  assert(format_error_line("type,client,tx,amount\ndeposit,1,1,1.0,extra\n") == 2);
  assert(format_error_line("type,client,tx,amount\ndeposit,1\n") == 2);
  assert(format_error_line("type,client,tx,amount\n\"deposit,1,1,1.0\n") == 2);

  try {
    count_rows("type,client,tx,amount\ndeposit,1,1,1.0\nbogus,1,1,1.0\n");
    assert(false && "expected a format error");
  } catch (const ingest::FormatError& e) {
    const std::string message = e.what();
    assert(message.find("line 3") != std::string::npos);
    assert(message.find("bogus") != std::string::npos);
  }
}

void test_csv_reader_file() {
  namespace fs = std::filesystem;
  const auto tmp_root = fs::temp_directory_path() / "paycore_tests";
  fs::remove_all(tmp_root);
  fs::create_directories(tmp_root);

  const auto path = tmp_root / "transactions.csv";
  {
    std::ofstream out(path);
    out << "type,client,tx,amount\n"
        << "deposit,1,1,1.0\n"
        << "deposit,2,2,2.0\n"
        << "deposit,1,3,2.0\n"
        << "withdrawal,1,4,1.5\n"
        << "withdrawal,2,5,3.0\n";
  }

  ingest::CsvReader reader(path);
  common::TransactionRecord record;
  std::size_t rows = 0;
  while (reader.next(record)) {
    ++rows;
  }
  assert(rows == 5);
  assert(record.kind == common::TransactionKind::kWithdrawal);
  assert(record.amount == 3.0);

  bool io_error = false;
  try {
    ingest::CsvReader missing(tmp_root / "missing.csv");
  } catch (const common::IoError&) {
    io_error = true;
  }
  assert(io_error);

  fs::remove_all(tmp_root);
}

void test_split_fields_and_amounts() {
  const auto fields = ingest::split_fields(R"( a ,"b, c", "say ""hi""" ,,)", ',');
  assert(fields.size() == 5);
  assert(fields[0] == "a");
  assert(fields[1] == "b, c");
  assert(fields[2] == "say \"hi\"");
  assert(fields[3].empty());
  assert(fields[4].empty());

  bool threw = false;
  try {
    (void)ingest::split_fields("\"open", ',');
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  assert(ingest::parse_amount("25.11") == 25.11);
  assert(ingest::parse_amount(" +3 ") == 3.0);
  assert(ingest::parse_amount("-4.5") == -4.5);
  assert(ingest::parse_amount("1e3") == 1000.0);
  assert(std::isnan(*ingest::parse_amount("NaN")));
  assert(std::isinf(*ingest::parse_amount("inf")));
  assert(!ingest::parse_amount("").has_value());
  assert(!ingest::parse_amount("  ").has_value());
  assert(!ingest::parse_amount("12abc").has_value());
}

}  // namespace paycore::tests
