#pragma once

// permagate/log.hpp — Structured JSONL logging.
//
// DESIGN:
//   One JSON object per line: {"level":..,"class":..,"message":..,<fields>}.
//   Components hold a Logger by value and derive a child per class, so every
//   line names the component that wrote it. Fields are string pairs; callers
//   render ids as base64url and offsets as decimal before logging.
//
// Thread-safety: emission is serialized by a process-wide mutex so lines
// from concurrent workers never interleave.
//
// EXTENSION_POINT: log_shipping
//   Current: stderr or a caller-supplied FILE*.
//   Upgrade path: a sink that batches lines to a collector. Invariant: log()
//   must never throw into the caller; cache and worker error paths rely on it.

#include <cstdio>
#include <string>
#include <utility>
#include <vector>

namespace permagate {

enum class LogLevel { debug = 0, info = 1, warn = 2, error = 3, silent = 4 };

std::string to_string(LogLevel level);

// Unknown names map to info.
LogLevel parse_log_level(const std::string& name);

using LogFields = std::vector<std::pair<std::string, std::string>>;

class Logger {
 public:
  Logger() = default;
  explicit Logger(std::string component) : component_(std::move(component)) {}

  Logger child(const std::string& component) const { return Logger(component); }

  void debug(const std::string& message, const LogFields& fields = {}) const;
  void info(const std::string& message, const LogFields& fields = {}) const;
  void warn(const std::string& message, const LogFields& fields = {}) const;
  void error(const std::string& message, const LogFields& fields = {}) const;

  void log(LogLevel level, const std::string& message,
           const LogFields& fields) const;

  const std::string& component() const { return component_; }

 private:
  std::string component_;
};

// Process-wide threshold; lines below it are dropped.
void set_log_level(LogLevel level);
LogLevel log_level();

// nullptr restores stderr. The caller keeps ownership of the FILE*.
void set_log_sink(std::FILE* sink);

}  // namespace permagate
