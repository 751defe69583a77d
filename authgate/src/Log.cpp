#include "authgate/Log.h"
#include "authgate/Util.h"
#include <chrono>
#include <ctime>
#include <iomanip>

namespace authgate {

std::string_view to_string(LogLevel l) {
  switch (l) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Error: return "ERROR";
  }
  return "INFO";
}

std::optional<LogLevel> parse_log_level(std::string_view s) {
  std::string n = to_lower(trim(s));
  if (n == "debug") return LogLevel::Debug;
  if (n == "info") return LogLevel::Info;
  if (n == "warn" || n == "warning") return LogLevel::Warn;
  if (n == "error") return LogLevel::Error;
  return std::nullopt;
}

StreamLogSink::StreamLogSink(std::ostream& out, LogLevel min_level)
    : out_(out), min_level_(min_level) {}

void StreamLogSink::log(LogLevel level, std::string_view component, std::string_view message) {
  if (level < min_level_) return;
  using namespace std::chrono;
  auto now = system_clock::now();
  std::time_t t = system_clock::to_time_t(now);
  auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm{};
  gmtime_r(&t, &tm);

  std::lock_guard<std::mutex> lock(mu_);
  out_ << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
       << std::setfill('0') << ms << std::setfill(' ') << "Z " << to_string(level)
       << " [" << component << "] " << message << '\n';
  out_.flush();
}

} // namespace authgate
