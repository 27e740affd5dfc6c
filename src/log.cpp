#include "permagate/log.hpp"

#include <atomic>
#include <chrono>
#include <mutex>

#include "permagate/jsonlite.hpp"

namespace permagate {

namespace {
std::atomic<int> g_level{static_cast<int>(LogLevel::info)};
std::atomic<std::FILE*> g_sink{nullptr};
std::mutex g_emit_mu;
}  // namespace

std::string to_string(LogLevel level) {
  switch (level) {
    case LogLevel::debug: return "debug";
    case LogLevel::info: return "info";
    case LogLevel::warn: return "warn";
    case LogLevel::error: return "error";
    case LogLevel::silent: return "silent";
  }
  return "info";
}

LogLevel parse_log_level(const std::string& name) {
  if (name == "debug") return LogLevel::debug;
  if (name == "warn") return LogLevel::warn;
  if (name == "error") return LogLevel::error;
  if (name == "silent") return LogLevel::silent;
  return LogLevel::info;
}

void set_log_level(LogLevel level) {
  g_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel log_level() {
  return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

void set_log_sink(std::FILE* sink) {
  g_sink.store(sink, std::memory_order_release);
}

void Logger::debug(const std::string& message, const LogFields& fields) const {
  log(LogLevel::debug, message, fields);
}
void Logger::info(const std::string& message, const LogFields& fields) const {
  log(LogLevel::info, message, fields);
}
void Logger::warn(const std::string& message, const LogFields& fields) const {
  log(LogLevel::warn, message, fields);
}
void Logger::error(const std::string& message, const LogFields& fields) const {
  log(LogLevel::error, message, fields);
}

void Logger::log(LogLevel level, const std::string& message,
                 const LogFields& fields) const {
  const LogLevel threshold = log_level();
  if (threshold == LogLevel::silent || level < threshold) return;

  const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();

  std::string line;
  line.reserve(128 + message.size());
  line += "{\"timestamp\":";
  line += std::to_string(now_ms);
  line += ",\"level\":\"";
  line += to_string(level);
  line += "\"";
  if (!component_.empty()) {
    line += ",\"class\":\"";
    line += jsonlite::escape(component_);
    line += "\"";
  }
  line += ",\"message\":\"";
  line += jsonlite::escape(message);
  line += "\"";
  for (const auto& [k, v] : fields) {
    line += ",\"";
    line += jsonlite::escape(k);
    line += "\":\"";
    line += jsonlite::escape(v);
    line += "\"";
  }
  line += "}\n";

  std::FILE* sink = g_sink.load(std::memory_order_acquire);
  if (!sink) sink = stderr;
  std::lock_guard<std::mutex> lk(g_emit_mu);
  std::fwrite(line.data(), 1, line.size(), sink);
  std::fflush(sink);
}

}  // namespace permagate
