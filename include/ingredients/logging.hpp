#pragma once

#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace ingredients {

enum class LogLevel { Off = 0, Error = 1, Warn = 2, Info = 3, Debug = 4 };

using LoggerCallback = std::function<void(LogLevel level, const std::string& message, const nlohmann::json& details)>;

/// Case-insensitive level lookup; std::nullopt for an unknown name.
std::optional<LogLevel> find_log_level(const std::string& value);

const char* log_level_name(LogLevel level);

/**
 * Writes one line per entry: `<UTC timestamp> [LEVEL] message {details}`.
 * Safe to call from concurrent request threads.
 */
LoggerCallback make_stream_logger(std::ostream& stream);

class Logger {
public:
  Logger() = default;
  Logger(LogLevel level, LoggerCallback callback)
      : level_(level), callback_(std::move(callback)) {}

  bool enabled(LogLevel level) const {
    return callback_ && level != LogLevel::Off && static_cast<int>(level) <= static_cast<int>(level_);
  }

  void log(LogLevel level, const std::string& message, const nlohmann::json& details = {}) const {
    if (!enabled(level)) {
      return;
    }
    callback_(level, message, details);
  }

private:
  LogLevel level_ = LogLevel::Off;
  LoggerCallback callback_;
};

}  // namespace ingredients
