#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>

namespace neurolens::core {

enum class LogLevel : std::uint8_t {
  Debug,
  Info,
  Warning,
  Error,
};

/// Receives every message at or above the logger's minimum level.
using LogSink = std::function<void(LogLevel level, std::string_view message)>;

/// Lightweight logging handle passed to pipeline components.
/// A default-constructed Logger discards everything; the application decides
/// where messages go by providing a sink.
class Logger {
 public:
  Logger() = default;
  explicit Logger(LogSink sink, LogLevel min_level = LogLevel::Info)
      : sink_(std::move(sink)), min_level_(min_level) {}

  void log(LogLevel level, std::string_view message) const;

  void debug(std::string_view message) const { log(LogLevel::Debug, message); }
  void info(std::string_view message) const { log(LogLevel::Info, message); }
  void warn(std::string_view message) const { log(LogLevel::Warning, message); }
  void error(std::string_view message) const { log(LogLevel::Error, message); }

  [[nodiscard]] bool enabled(LogLevel level) const noexcept {
    return sink_ && level >= min_level_;
  }
  [[nodiscard]] LogLevel min_level() const noexcept { return min_level_; }

 private:
  LogSink sink_;
  LogLevel min_level_{LogLevel::Info};
};

/// Sink writing "YYYY-MM-DD HH:MM:SS - neurolens - LEVEL - message" to stderr.
LogSink stderr_sink();

[[nodiscard]] std::string_view to_string(LogLevel level) noexcept;

/// Parses "debug", "info", "warning"/"warn", "error" (case-insensitive).
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text);

}  // namespace neurolens::core
