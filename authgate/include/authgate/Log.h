#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace authgate {

enum class LogLevel : uint8_t {
  Debug = 0,
  Info = 1,
  Warn = 2,
  Error = 3,
};

std::string_view to_string(LogLevel l);
std::optional<LogLevel> parse_log_level(std::string_view s);

class ILogSink {
 public:
  virtual ~ILogSink() = default;
  virtual void log(LogLevel level, std::string_view component, std::string_view message) = 0;
};

class NoopLogSink final : public ILogSink {
 public:
  void log(LogLevel, std::string_view, std::string_view) override {}
};

// One line per event: "<iso8601 utc> <LEVEL> [component] message".
class StreamLogSink final : public ILogSink {
 public:
  StreamLogSink(std::ostream& out, LogLevel min_level);
  void log(LogLevel level, std::string_view component, std::string_view message) override;

 private:
  std::ostream& out_;
  LogLevel min_level_{LogLevel::Info};
  std::mutex mu_;
};

} // namespace authgate
