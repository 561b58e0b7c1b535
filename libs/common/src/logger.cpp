#include "paycore/common/logger.hpp"

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace paycore {
namespace common {

namespace {

bool iequals(std::string_view lhs, std::string_view rhs) noexcept {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(lhs[i])) !=
        std::tolower(static_cast<unsigned char>(rhs[i]))) {
      return false;
    }
  }
  return true;
}

}  // namespace

std::string_view to_string(LogLevel level) noexcept {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarning:
      return "warning";
    case LogLevel::kError:
      return "error";
  }
  return "unknown";
}

std::optional<LogLevel> parse_log_level(std::string_view text) noexcept {
  if (iequals(text, "debug")) {
    return LogLevel::kDebug;
  }
  if (iequals(text, "info")) {
    return LogLevel::kInfo;
  }
  if (iequals(text, "warning") || iequals(text, "warn")) {
    return LogLevel::kWarning;
  }
  if (iequals(text, "error")) {
    return LogLevel::kError;
  }
  return std::nullopt;
}

Logger& Logger::instance() {
  static Logger logger;
  return logger;
}

Logger::Logger() : out_(&std::cerr) {}

void Logger::set_stream(std::ostream* out) {
  std::scoped_lock lock(mutex_);
  out_ = out ? out : &std::cerr;
}

void Logger::write(LogLevel level, std::string_view message) {
  const auto now = std::chrono::system_clock::now();
  const auto now_c = std::chrono::system_clock::to_time_t(now);
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

  std::tm local_tm{};
#if defined(_WIN32)
  localtime_s(&local_tm, &now_c);
#else
  localtime_r(&now_c, &local_tm);
#endif

  std::scoped_lock lock(mutex_);
  *out_ << '[' << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3)
        << std::setfill('0') << millis.count() << std::setfill(' ') << "] [" << to_string(level)
        << "] " << message << '\n';
  out_->flush();
}

}  // namespace common
}  // namespace paycore
