#include "paycore/ingest/csv_reader.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <system_error>

#include "paycore/common/errors.hpp"

namespace paycore {
namespace ingest {

namespace {

constexpr std::string_view kUtf8Bom{"\xEF\xBB\xBF"};

std::string_view trim(std::string_view text) noexcept {
  const auto is_blank = [](char c) { return c == ' ' || c == '\t'; };
  while (!text.empty() && is_blank(text.front())) {
    text.remove_prefix(1);
  }
  while (!text.empty() && is_blank(text.back())) {
    text.remove_suffix(1);
  }
  return text;
}

std::string lowercase(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

template <typename T>
std::optional<T> parse_unsigned(std::string_view text) noexcept {
  if (text.empty()) {
    return std::nullopt;
  }
  T value{};
  const auto* end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return value;
}

bool blank(std::string_view line) noexcept {
  return std::all_of(line.begin(), line.end(),
                     [](unsigned char c) { return std::isspace(c) != 0; });
}

}  // namespace

FormatError::FormatError(std::uint64_t line, const std::string& message)
    : std::runtime_error("line " + std::to_string(line) + ": " + message), line_(line) {}

std::vector<std::string> split_fields(std::string_view line, char delimiter) {
  std::vector<std::string> fields;
  std::string current;
  bool quoted = false;
  bool in_quotes = false;

  auto finish_field = [&]() {
    fields.emplace_back(quoted ? std::string_view(current) : trim(current));
    current.clear();
    quoted = false;
  };

  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (in_quotes) {
      if (c == '"') {
        if (i + 1 < line.size() && line[i + 1] == '"') {
          current.push_back('"');
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        current.push_back(c);
      }
      continue;
    }

    if (c == delimiter) {
      finish_field();
    } else if (c == '"' && trim(current).empty()) {
      current.clear();
      quoted = true;
      in_quotes = true;
    } else if (quoted && (c == ' ' || c == '\t')) {
      // padding after a closing quote
    } else {
      current.push_back(c);
    }
  }

  if (in_quotes) {
    throw std::invalid_argument("unterminated quoted field");
  }
  finish_field();
  return fields;
}

std::optional<double> parse_amount(std::string_view text) noexcept {
  text = trim(text);
  if (!text.empty() && text.front() == '+') {
    text.remove_prefix(1);
  }
  if (text.empty()) {
    return std::nullopt;
  }
  double value = 0.0;
  const auto* end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return value;
}

CsvReader::CsvReader(const std::filesystem::path& path, char delimiter)
    : file_(path), delimiter_(delimiter) {
  if (!file_) {
    throw common::IoError("failed to open transactions file: " + path.string());
  }
  input_ = &file_;
  read_header();
}

CsvReader::CsvReader(std::istream& input, char delimiter)
    : input_(&input), delimiter_(delimiter) {
  read_header();
}

bool CsvReader::read_line(std::string& out_line) {
  while (std::getline(*input_, out_line)) {
    ++line_;
    if (!out_line.empty() && out_line.back() == '\r') {
      out_line.pop_back();
    }
    if (!blank(out_line)) {
      return true;
    }
  }
  if (input_->bad()) {
    throw common::IoError("read failure at line " + std::to_string(line_ + 1));
  }
  return false;
}

void CsvReader::read_header() {
  std::string header_line;
  if (!read_line(header_line)) {
    throw FormatError(line_ + 1, "missing header row");
  }
  if (header_line.starts_with(kUtf8Bom)) {
    header_line.erase(0, kUtf8Bom.size());
  }

  std::vector<std::string> names;
  try {
    names = split_fields(header_line, delimiter_);
  } catch (const std::invalid_argument& e) {
    throw FormatError(line_, e.what());
  }

  std::optional<std::size_t> type_col;
  std::optional<std::size_t> client_col;
  std::optional<std::size_t> tx_col;
  for (std::size_t i = 0; i < names.size(); ++i) {
    const auto name = lowercase(trim(names[i]));
    if (name == "type" && !type_col) {
      type_col = i;
    } else if (name == "client" && !client_col) {
      client_col = i;
    } else if (name == "tx" && !tx_col) {
      tx_col = i;
    } else if (name == "amount" && !columns_.amount) {
      columns_.amount = i;
    }
  }

  if (!type_col || !client_col || !tx_col) {
    std::string missing;
    for (const auto& [col, name] : {std::pair{type_col, "type"}, std::pair{client_col, "client"},
                                    std::pair{tx_col, "tx"}}) {
      if (!col) {
        missing += missing.empty() ? name : std::string(", ") + name;
      }
    }
    throw FormatError(line_, "header is missing column(s): " + missing);
  }

  columns_.type = *type_col;
  columns_.client = *client_col;
  columns_.tx = *tx_col;
  columns_.count = names.size();
}

bool CsvReader::next(common::TransactionRecord& out_record) {
  std::string row;
  if (!read_line(row)) {
    return false;
  }

  std::vector<std::string> fields;
  try {
    fields = split_fields(row, delimiter_);
  } catch (const std::invalid_argument& e) {
    throw FormatError(line_, e.what());
  }

  if (fields.size() > columns_.count) {
    throw FormatError(line_, "expected " + std::to_string(columns_.count) + " fields, found " +
                                 std::to_string(fields.size()));
  }
  const std::size_t required = std::max({columns_.type, columns_.client, columns_.tx}) + 1;
  if (fields.size() < required) {
    throw FormatError(line_, "expected at least " + std::to_string(required) +
                                 " fields, found " + std::to_string(fields.size()));
  }

  out_record = parse_row(fields);
  return true;
}

common::TransactionRecord CsvReader::parse_row(const std::vector<std::string>& fields) const {
  common::TransactionRecord record;

  const auto kind = common::parse_transaction_kind(fields[columns_.type]);
  if (!kind) {
    throw FormatError(line_, "unknown transaction type '" + fields[columns_.type] + "'");
  }
  record.kind = *kind;

  const auto client = parse_unsigned<common::ClientId>(fields[columns_.client]);
  if (!client) {
    throw FormatError(line_, "invalid client id '" + fields[columns_.client] + "'");
  }
  record.client = *client;

  const auto tx = parse_unsigned<common::TxId>(fields[columns_.tx]);
  if (!tx) {
    throw FormatError(line_, "invalid tx id '" + fields[columns_.tx] + "'");
  }
  record.tx = *tx;

  if (columns_.amount && *columns_.amount < fields.size()) {
    record.amount = parse_amount(fields[*columns_.amount]);
  }
  return record;
}

}  // namespace ingest
}  // namespace paycore
