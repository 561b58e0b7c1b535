#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace paycore {
namespace config {

struct LogConfig {
  std::string level{"info"};
};

struct InputConfig {
  std::string delimiter{","};
};

struct OutputConfig {
  std::string delimiter{","};
  std::int64_t decimal_places{4};
};

struct ProcessingConfig {
  std::string on_ledger_error{"halt"};
};

struct PaycoreConfig {
  LogConfig log;
  InputConfig input;
  OutputConfig output;
  ProcessingConfig processing;
};

struct ValidationError {
  std::string field;
  std::string message;
};

struct LoadResult {
  bool success{false};
  PaycoreConfig config;
  std::vector<ValidationError> errors;
  std::string raw_error;
};

class ConfigLoader {
 public:
  static constexpr std::int64_t kMaxDecimalPlaces = 12;

  static LoadResult load(const std::filesystem::path& path);
  static LoadResult load_from_string(std::string_view toml_content);
  static std::vector<ValidationError> validate(const PaycoreConfig& config);
  static std::string generate_default();
};

}  // namespace config
}  // namespace paycore
