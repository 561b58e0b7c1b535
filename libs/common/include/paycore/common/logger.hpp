#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace paycore {
namespace common {

enum class LogLevel : std::uint8_t {
  kDebug,
  kInfo,
  kWarning,
  kError,
};

[[nodiscard]] std::string_view to_string(LogLevel level) noexcept;
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text) noexcept;

// Process-wide leveled logger. Writes to stderr unless redirected; stdout is
// reserved for the account table.
class Logger {
 public:
  static Logger& instance();

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void set_level(LogLevel level) noexcept { level_ = level; }
  [[nodiscard]] LogLevel level() const noexcept { return level_; }
  [[nodiscard]] bool enabled(LogLevel level) const noexcept { return level >= level_; }

  // nullptr restores stderr.
  void set_stream(std::ostream* out);

  void write(LogLevel level, std::string_view message);

  template <typename... Args>
  void log(LogLevel level, Args&&... args) {
    if (!enabled(level)) {
      return;
    }
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    write(level, oss.str());
  }

 private:
  Logger();

  std::mutex mutex_;
  std::ostream* out_;
  LogLevel level_{LogLevel::kInfo};
};

}  // namespace common
}  // namespace paycore

#define PAYCORE_LOG_AT(level, ...)                                   \
  do {                                                               \
    auto& paycore_logger_ = ::paycore::common::Logger::instance();   \
    if (paycore_logger_.enabled(level)) {                            \
      paycore_logger_.log(level, __VA_ARGS__);                       \
    }                                                                \
  } while (false)

#define PAYCORE_LOG_DEBUG(...) PAYCORE_LOG_AT(::paycore::common::LogLevel::kDebug, __VA_ARGS__)
#define PAYCORE_LOG_INFO(...) PAYCORE_LOG_AT(::paycore::common::LogLevel::kInfo, __VA_ARGS__)
#define PAYCORE_LOG_WARN(...) PAYCORE_LOG_AT(::paycore::common::LogLevel::kWarning, __VA_ARGS__)
#define PAYCORE_LOG_ERROR(...) PAYCORE_LOG_AT(::paycore::common::LogLevel::kError, __VA_ARGS__)
