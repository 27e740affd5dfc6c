#pragma once

// permagate/config.hpp — Process configuration.
//
// PRECEDENCE (lowest to highest):
//   1. Built-in defaults below.
//   2. Optional JSON config file (keys are the field names).
//   3. PERMAGATE_* environment variables.
//
// INVARIANT: load_config() either returns a fully validated config or throws
// GatewayError(config_invalid | filter_invalid). Components never re-validate.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "permagate/log.hpp"

namespace permagate {

struct GatewayConfig {
  // Upstream
  std::string trusted_node_url{"https://arweave.net"};
  std::vector<std::string> trusted_gateway_urls{"https://arweave.net"};
  uint64_t http_timeout_ms{15000};

  // Local storage
  std::string chunk_cache_dir{"data/chunks"};
  std::string contiguous_data_dir{"data/contiguous"};
  std::string contiguous_data_compression{"off"};  // "off" | "zstd"

  // Worker pools
  uint64_t ans104_download_workers{1};
  uint64_t ans104_download_queue_size{100};
  uint64_t ans104_unbundle_workers{1};
  uint64_t ans104_unbundle_queue_size{1000};

  // Filter expression (JSON) applied to unbundled items. Empty emits nothing.
  std::string ans104_index_filter{"{\"always\":true}"};

  LogLevel log_level{LogLevel::info};
  std::string event_log_path;

  std::string to_json() const;
};

// Reads defaults, then `config_path` when given, then the environment.
GatewayConfig load_config(const std::optional<std::string>& config_path = std::nullopt);

// Applies only the environment layer on top of `base`.
void apply_env_overrides(GatewayConfig& config);

}  // namespace permagate
