#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <sstream>
#include <string_view>

namespace boxscan::core {

enum class LogLevel : std::uint8_t {
  Debug,
  Info,
  Warn,
  Error,
  Off,
};

/// Receives every message at or above the current level. Called from worker
/// threads; calls are serialized by the logger.
using LogSink =
    std::function<void(LogLevel level, std::string_view tag, std::string_view message)>;

void set_log_level(LogLevel level) noexcept;
[[nodiscard]] LogLevel log_level() noexcept;
[[nodiscard]] bool log_enabled(LogLevel level) noexcept;

/// Replace the sink; an empty function restores the default (std::cerr).
void set_log_sink(LogSink sink);

void log_message(LogLevel level, std::string_view tag, std::string_view message);

[[nodiscard]] std::string_view to_string(LogLevel level) noexcept;
[[nodiscard]] bool parse_log_level(std::string_view name, LogLevel& out) noexcept;

/// One log line, handed to the sink when the object is destroyed (at the end
/// of the full expression for a temporary). Nothing is formatted when the
/// level is disabled.
///
///   core::log_warn("catalog") << path << ":" << line_no << ": bad line";
class LogLine {
 public:
  LogLine(LogLevel level, std::string_view tag);
  ~LogLine();

  LogLine(const LogLine&) = delete;
  LogLine& operator=(const LogLine&) = delete;

  template <typename T>
  LogLine& operator<<(const T& value) {
    if (os_) {
      *os_ << value;
    }
    return *this;
  }

 private:
  LogLevel level_;
  std::string_view tag_;
  std::optional<std::ostringstream> os_;
};

inline LogLine log_debug(std::string_view tag) { return LogLine(LogLevel::Debug, tag); }
inline LogLine log_info(std::string_view tag) { return LogLine(LogLevel::Info, tag); }
inline LogLine log_warn(std::string_view tag) { return LogLine(LogLevel::Warn, tag); }
inline LogLine log_error(std::string_view tag) { return LogLine(LogLevel::Error, tag); }

}  // namespace boxscan::core
