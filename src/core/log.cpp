#include <boxscan/core/log.hpp>
#include <atomic>
#include <iostream>
#include <mutex>
#include <string>

namespace boxscan::core {

namespace {

std::atomic<LogLevel> g_level{LogLevel::Warn};
std::mutex g_sink_mutex;
LogSink g_sink;

}  // namespace

void set_log_level(LogLevel level) noexcept { g_level.store(level); }

LogLevel log_level() noexcept { return g_level.load(); }

bool log_enabled(LogLevel level) noexcept {
  const LogLevel current = g_level.load();
  return current != LogLevel::Off && level != LogLevel::Off && level >= current;
}

void set_log_sink(LogSink sink) {
  std::lock_guard lock(g_sink_mutex);
  g_sink = std::move(sink);
}

void log_message(LogLevel level, std::string_view tag, std::string_view message) {
  if (!log_enabled(level)) return;
  std::lock_guard lock(g_sink_mutex);
  if (g_sink) {
    g_sink(level, tag, message);
    return;
  }
  std::cerr << "[boxscan] [" << to_string(level) << "] " << tag << ": " << message
            << "\n";
}

LogLine::LogLine(LogLevel level, std::string_view tag) : level_(level), tag_(tag) {
  if (log_enabled(level)) {
    os_.emplace();
  }
}

LogLine::~LogLine() {
  if (os_) {
    log_message(level_, tag_, os_->str());
  }
}

std::string_view to_string(LogLevel level) noexcept {
  switch (level) {
    case LogLevel::Debug:
      return "D";
    case LogLevel::Info:
      return "I";
    case LogLevel::Warn:
      return "W";
    case LogLevel::Error:
      return "E";
    case LogLevel::Off:
      return "-";
  }
  return "?";
}

bool parse_log_level(std::string_view name, LogLevel& out) noexcept {
  if (name == "debug") out = LogLevel::Debug;
  else if (name == "info") out = LogLevel::Info;
  else if (name == "warn") out = LogLevel::Warn;
  else if (name == "error") out = LogLevel::Error;
  else if (name == "off") out = LogLevel::Off;
  else return false;
  return true;
}

}  // namespace boxscan::core
