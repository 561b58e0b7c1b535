#include "paycore/config/config_loader.hpp"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.hpp>

#include <sstream>

#include "paycore/common/logger.hpp"

namespace paycore {
namespace config {

namespace {

std::int64_t get_int_or(const toml::table& tbl, std::string_view key, std::int64_t default_val) {
  if (auto val = tbl[key].value<std::int64_t>()) {
    return *val;
  }
  return default_val;
}

std::string get_str_or(const toml::table& tbl, std::string_view key, std::string_view default_val) {
  if (auto val = tbl[key].value<std::string_view>()) {
    return std::string(*val);
  }
  return std::string(default_val);
}

LogConfig parse_log(const toml::table& root) {
  LogConfig cfg;
  if (auto* log = root["log"].as_table()) {
    cfg.level = get_str_or(*log, "level", cfg.level);
  }
  return cfg;
}

InputConfig parse_input(const toml::table& root) {
  InputConfig cfg;
  if (auto* input = root["input"].as_table()) {
    cfg.delimiter = get_str_or(*input, "delimiter", cfg.delimiter);
  }
  return cfg;
}

OutputConfig parse_output(const toml::table& root) {
  OutputConfig cfg;
  if (auto* output = root["output"].as_table()) {
    cfg.delimiter = get_str_or(*output, "delimiter", cfg.delimiter);
    cfg.decimal_places = get_int_or(*output, "decimal_places", cfg.decimal_places);
  }
  return cfg;
}

ProcessingConfig parse_processing(const toml::table& root) {
  ProcessingConfig cfg;
  if (auto* processing = root["processing"].as_table()) {
    cfg.on_ledger_error = get_str_or(*processing, "on_ledger_error", cfg.on_ledger_error);
  }
  return cfg;
}

PaycoreConfig parse_config(const toml::table& root) {
  PaycoreConfig cfg;
  cfg.log = parse_log(root);
  cfg.input = parse_input(root);
  cfg.output = parse_output(root);
  cfg.processing = parse_processing(root);
  return cfg;
}

void validate_delimiter(const std::string& field, const std::string& delimiter,
                        std::vector<ValidationError>& errors) {
  if (delimiter.size() != 1) {
    errors.push_back({field, "must be exactly one character"});
    return;
  }
  if (delimiter[0] == '"' || delimiter[0] == '\n' || delimiter[0] == '\r') {
    errors.push_back({field, "cannot be a quote or line break"});
  }
}

}  // namespace

LoadResult ConfigLoader::load(const std::filesystem::path& path) {
  LoadResult result;

  if (!std::filesystem::exists(path)) {
    result.raw_error = "Config file not found: " + path.string();
    return result;
  }

  auto parse_result = toml::parse_file(path.string());
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  result.config = parse_config(parse_result.table());
  result.errors = validate(result.config);
  result.success = result.errors.empty();
  return result;
}

LoadResult ConfigLoader::load_from_string(std::string_view toml_content) {
  LoadResult result;

  auto parse_result = toml::parse(toml_content);
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  result.config = parse_config(parse_result.table());
  result.errors = validate(result.config);
  result.success = result.errors.empty();
  return result;
}

std::vector<ValidationError> ConfigLoader::validate(const PaycoreConfig& config) {
  std::vector<ValidationError> errors;

  if (!common::parse_log_level(config.log.level)) {
    errors.push_back({"log.level", "must be one of debug, info, warning, error"});
  }

  validate_delimiter("input.delimiter", config.input.delimiter, errors);
  validate_delimiter("output.delimiter", config.output.delimiter, errors);

  if (config.output.decimal_places < 0 || config.output.decimal_places > kMaxDecimalPlaces) {
    errors.push_back({"output.decimal_places",
                      "must be between 0 and " + std::to_string(kMaxDecimalPlaces)});
  }

  const auto& policy = config.processing.on_ledger_error;
  if (policy != "halt" && policy != "skip") {
    errors.push_back({"processing.on_ledger_error", "must be halt or skip"});
  }

  return errors;
}

std::string ConfigLoader::generate_default() {
  return R"(# paycore configuration
# Generated default configuration

[log]
level = "info"   # debug | info | warning | error

[input]
delimiter = ","

[output]
delimiter = ","
decimal_places = 4

[processing]
on_ledger_error = "halt"   # halt | skip
)";
}

}  // namespace config
}  // namespace paycore
