#include "ingredients/logging.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iterator>
#include <memory>
#include <mutex>
#include <ostream>
#include <sstream>

namespace ingredients {
namespace {

std::string utc_timestamp() {
  auto now = std::chrono::system_clock::now();
  std::time_t seconds = std::chrono::system_clock::to_time_t(now);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &seconds);
#else
  gmtime_r(&seconds, &tm);
#endif
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
  return out.str();
}

}  // namespace

std::optional<LogLevel> find_log_level(const std::string& value) {
  std::string lowered; lowered.reserve(value.size());
  std::transform(value.begin(), value.end(), std::back_inserter(lowered), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lowered == "off") return LogLevel::Off;
  if (lowered == "error") return LogLevel::Error;
  if (lowered == "warn" || lowered == "warning") return LogLevel::Warn;
  if (lowered == "info") return LogLevel::Info;
  if (lowered == "debug") return LogLevel::Debug;
  return std::nullopt;
}

const char* log_level_name(LogLevel level) {
  switch (level) {
    case LogLevel::Off:
      return "OFF";
    case LogLevel::Error:
      return "ERROR";
    case LogLevel::Warn:
      return "WARN";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Debug:
      return "DEBUG";
  }
  return "UNKNOWN";
}

LoggerCallback make_stream_logger(std::ostream& stream) {
  auto mutex = std::make_shared<std::mutex>();
  return [&stream, mutex](LogLevel level, const std::string& message, const nlohmann::json& details) {
    std::ostringstream line;
    line << utc_timestamp() << " [" << log_level_name(level) << "] " << message;
    if (!details.is_null() && !details.empty()) {
      line << ' ' << details.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    line << '\n';
    std::lock_guard<std::mutex> lock(*mutex);
    stream << line.str() << std::flush;
  };
}

}  // namespace ingredients
