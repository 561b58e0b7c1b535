#include <cstdint>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <utility>

#include "paycore/common/errors.hpp"
#include "paycore/common/logger.hpp"
#include "paycore/config/config_loader.hpp"
#include "paycore/ingest/csv_reader.hpp"
#include "paycore/ledger/ledger_state.hpp"
#include "paycore/replay/replay_driver.hpp"
#include "paycore/snapshot/account_writer.hpp"

namespace {

enum ExitCode : int {
  kExitOk = 0,
  kExitUsage = 1,
  kExitIo = 2,
  kExitFormat = 3,
  kExitLedger = 4,
  kExitConfig = 5,
};

void print_usage(const char* program) {
  std::cerr << "Usage: " << program << " <transactions.csv> [config_file]\n"
            << "  transactions.csv: type,client,tx,amount rows with a header line\n"
            << "  config_file:      Path to TOML configuration file\n"
            << "                    If not specified, uses ./paycore.toml or built-in defaults\n";
}

std::filesystem::path find_config_path(int argc, char* argv[]) {
  if (argc > 2) {
    return std::filesystem::path{argv[2]};
  }
  const std::filesystem::path local{"./paycore.toml"};
  if (std::filesystem::exists(local)) {
    return local;
  }
  return {};
}

bool load_config(const std::filesystem::path& config_path, paycore::config::PaycoreConfig& cfg) {
  using paycore::config::ConfigLoader;

  auto result = config_path.empty() ? ConfigLoader::load_from_string(ConfigLoader::generate_default())
                                    : ConfigLoader::load(config_path);
  if (!result.success) {
    if (!result.raw_error.empty()) {
      PAYCORE_LOG_ERROR("config parse error: ", result.raw_error);
    }
    for (const auto& err : result.errors) {
      PAYCORE_LOG_ERROR("config validation error [", err.field, "]: ", err.message);
    }
    return false;
  }
  cfg = std::move(result.config);
  return true;
}

int run(const std::filesystem::path& input_path, const paycore::config::PaycoreConfig& cfg) {
  using namespace paycore;

  ledger::LedgerState ledger;
  replay::Driver driver{ledger};
  driver.configure(replay::parse_error_policy(cfg.processing.on_ledger_error)
                       .value_or(replay::ErrorPolicy::kHalt));
  driver.set_reject_handler([](std::uint64_t line, const ledger::ApplyResult& result) {
    PAYCORE_LOG_DEBUG("line ", line, ": rejected (", ledger::to_string(result.status), ")");
  });

  ingest::CsvReader reader{input_path, cfg.input.delimiter.front()};
  const auto summary = driver.execute(reader);

  if (summary.halted()) {
    PAYCORE_LOG_ERROR("line ", summary.halted_line, ": ", ledger::describe(*summary.halted_on));
    return kExitLedger;
  }

  const auto accounts = ledger.export_accounts();

  // Render fully before touching stdout so a failure leaves no partial table.
  std::ostringstream table;
  snapshot::AccountWriter writer{snapshot::AccountWriter::Options{
      .delimiter = cfg.output.delimiter.front(),
      .decimal_places = static_cast<int>(cfg.output.decimal_places),
  }};
  writer.write(table, accounts);

  std::cout << table.str();
  std::cout.flush();
  if (!std::cout) {
    throw common::IoError("failed to write account table to stdout");
  }

  PAYCORE_LOG_INFO("processed ", summary.records_read, " records: ", summary.applied, " applied, ",
                   summary.rejected, " rejected, ", accounts.size(), " accounts");
  return kExitOk;
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace paycore;

  if (argc < 2) {
    PAYCORE_LOG_ERROR("missing transactions file argument");
    print_usage(argv[0]);
    return kExitUsage;
  }

  config::PaycoreConfig cfg;
  if (!load_config(find_config_path(argc, argv), cfg)) {
    return kExitConfig;
  }
  common::Logger::instance().set_level(
      common::parse_log_level(cfg.log.level).value_or(common::LogLevel::kInfo));

  const std::filesystem::path input_path{argv[1]};
  try {
    return run(input_path, cfg);
  } catch (const ingest::FormatError& e) {
    PAYCORE_LOG_ERROR("input format error in ", input_path.string(), ": ", e.what());
    return kExitFormat;
  } catch (const common::IoError& e) {
    PAYCORE_LOG_ERROR("i/o error: ", e.what());
    return kExitIo;
  } catch (const std::filesystem::filesystem_error& e) {
    PAYCORE_LOG_ERROR("i/o error: ", e.what());
    return kExitIo;
  }
}
