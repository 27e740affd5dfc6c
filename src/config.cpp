#include "permagate/config.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <variant>

#include "permagate/filters.hpp"
#include "permagate/jsonlite.hpp"
#include "permagate/types.hpp"

namespace permagate {

namespace {

uint64_t parse_u64(const std::string& name, const std::string& text) {
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
    throw GatewayError(ErrorCode::config_invalid,
                       name + " must be a non-negative integer, got '" + text + "'");
  }
  try {
    return std::stoull(text);
  } catch (const std::out_of_range&) {
    throw GatewayError(ErrorCode::config_invalid, name + " is out of range");
  }
}

// A key that is present in the config file must carry the right JSON type;
// only absent keys fall back to the current value.
uint64_t file_u64(const jsonlite::Object& obj, const std::string& key, uint64_t current) {
  const auto* v = jsonlite::find(obj, key);
  if (!v) return current;
  if (!std::holds_alternative<std::uint64_t>(v->v)) {
    throw GatewayError(ErrorCode::config_invalid,
                       "config file: " + key + " must be a non-negative integer, got " +
                           jsonlite::to_json(*v));
  }
  return std::get<std::uint64_t>(v->v);
}

std::string file_string(const jsonlite::Object& obj, const std::string& key,
                        const std::string& current) {
  const auto* v = jsonlite::find(obj, key);
  if (!v) return current;
  if (!v->is_string()) {
    throw GatewayError(ErrorCode::config_invalid,
                       "config file: " + key + " must be a string, got " + jsonlite::to_json(*v));
  }
  return std::get<std::string>(v->v);
}

std::vector<std::string> split_urls(const std::string& text) {
  std::vector<std::string> out;
  std::string cur;
  std::istringstream in(text);
  while (std::getline(in, cur, ',')) {
    const auto b = cur.find_first_not_of(" \t");
    const auto e = cur.find_last_not_of(" \t");
    if (b == std::string::npos) continue;
    std::string url = cur.substr(b, e - b + 1);
    while (!url.empty() && url.back() == '/') url.pop_back();
    out.push_back(url);
  }
  return out;
}

const char* env(const char* name) {
  const char* v = std::getenv(name);
  return (v && v[0]) ? v : nullptr;
}

void apply_file(GatewayConfig& c, const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    throw GatewayError(ErrorCode::config_invalid, "cannot open config file: " + path);
  }
  const std::string text((std::istreambuf_iterator<char>(ifs)),
                         std::istreambuf_iterator<char>());
  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(text, &err);
  if (err) {
    throw GatewayError(ErrorCode::config_invalid,
                       "config file " + path + ": " + err->code + " " + err->message);
  }

  c.trusted_node_url = file_string(obj, "trusted_node_url", c.trusted_node_url);
  if (const auto* urls = jsonlite::find(obj, "trusted_gateway_urls")) {
    if (!urls->is_array()) {
      throw GatewayError(ErrorCode::config_invalid,
                         "config file: trusted_gateway_urls must be an array of strings");
    }
    std::vector<std::string> list;
    for (const auto& item : std::get<jsonlite::Array>(urls->v)) {
      if (!item.is_string()) {
        throw GatewayError(ErrorCode::config_invalid,
                           "config file: trusted_gateway_urls must be an array of strings");
      }
      list.push_back(std::get<std::string>(item.v));
    }
    c.trusted_gateway_urls = std::move(list);
  }
  c.http_timeout_ms = file_u64(obj, "http_timeout_ms", c.http_timeout_ms);
  c.chunk_cache_dir = file_string(obj, "chunk_cache_dir", c.chunk_cache_dir);
  c.contiguous_data_dir = file_string(obj, "contiguous_data_dir", c.contiguous_data_dir);
  c.contiguous_data_compression =
      file_string(obj, "contiguous_data_compression", c.contiguous_data_compression);
  c.ans104_download_workers =
      file_u64(obj, "ans104_download_workers", c.ans104_download_workers);
  c.ans104_download_queue_size =
      file_u64(obj, "ans104_download_queue_size", c.ans104_download_queue_size);
  c.ans104_unbundle_workers =
      file_u64(obj, "ans104_unbundle_workers", c.ans104_unbundle_workers);
  c.ans104_unbundle_queue_size =
      file_u64(obj, "ans104_unbundle_queue_size", c.ans104_unbundle_queue_size);

  // The filter may be given inline as an object or as a JSON string.
  if (const auto* f = jsonlite::find(obj, "ans104_index_filter")) {
    c.ans104_index_filter = f->is_string() ? std::get<std::string>(f->v)
                                           : jsonlite::to_json(*f);
  }
  if (jsonlite::find(obj, "log_level")) {
    c.log_level = parse_log_level(file_string(obj, "log_level", ""));
  }
  c.event_log_path = file_string(obj, "event_log", c.event_log_path);
}

void validate(const GatewayConfig& c) {
  if (c.contiguous_data_compression != "off" && c.contiguous_data_compression != "zstd") {
    throw GatewayError(ErrorCode::config_invalid,
                       "contiguous_data_compression must be 'off' or 'zstd', got '" +
                           c.contiguous_data_compression + "'");
  }
  if (c.http_timeout_ms == 0) {
    throw GatewayError(ErrorCode::config_invalid, "http_timeout_ms must be positive");
  }
  if (c.chunk_cache_dir.empty() || c.contiguous_data_dir.empty()) {
    throw GatewayError(ErrorCode::config_invalid, "storage directories must be set");
  }
  // Throws filter_invalid on a bad expression.
  create_filter(c.ans104_index_filter);
}

}  // namespace

void apply_env_overrides(GatewayConfig& c) {
  if (const char* e = env("PERMAGATE_TRUSTED_NODE_URL")) c.trusted_node_url = e;
  if (const char* e = env("PERMAGATE_TRUSTED_GATEWAY_URLS")) {
    c.trusted_gateway_urls = split_urls(e);
  }
  if (const char* e = env("PERMAGATE_HTTP_TIMEOUT_MS")) {
    c.http_timeout_ms = parse_u64("PERMAGATE_HTTP_TIMEOUT_MS", e);
  }
  if (const char* e = env("PERMAGATE_CHUNK_CACHE_DIR")) c.chunk_cache_dir = e;
  if (const char* e = env("PERMAGATE_CONTIGUOUS_DATA_DIR")) c.contiguous_data_dir = e;
  if (const char* e = env("PERMAGATE_CONTIGUOUS_DATA_COMPRESSION")) {
    c.contiguous_data_compression = e;
  }
  if (const char* e = env("PERMAGATE_ANS104_DOWNLOAD_WORKERS")) {
    c.ans104_download_workers = parse_u64("PERMAGATE_ANS104_DOWNLOAD_WORKERS", e);
  }
  if (const char* e = env("PERMAGATE_ANS104_DOWNLOAD_QUEUE_SIZE")) {
    c.ans104_download_queue_size = parse_u64("PERMAGATE_ANS104_DOWNLOAD_QUEUE_SIZE", e);
  }
  if (const char* e = env("PERMAGATE_ANS104_UNBUNDLE_WORKERS")) {
    c.ans104_unbundle_workers = parse_u64("PERMAGATE_ANS104_UNBUNDLE_WORKERS", e);
  }
  if (const char* e = env("PERMAGATE_ANS104_UNBUNDLE_QUEUE_SIZE")) {
    c.ans104_unbundle_queue_size = parse_u64("PERMAGATE_ANS104_UNBUNDLE_QUEUE_SIZE", e);
  }
  // Set-but-empty is meaningful here: it selects the never-match filter.
  if (const char* e = std::getenv("PERMAGATE_ANS104_INDEX_FILTER")) {
    c.ans104_index_filter = e;
  }
  if (const char* e = env("PERMAGATE_LOG_LEVEL")) c.log_level = parse_log_level(e);
  if (const char* e = env("PERMAGATE_EVENT_LOG")) c.event_log_path = e;
}

GatewayConfig load_config(const std::optional<std::string>& config_path) {
  GatewayConfig c;
  if (config_path) apply_file(c, *config_path);
  apply_env_overrides(c);
  validate(c);
  return c;
}

std::string GatewayConfig::to_json() const {
  jsonlite::Array gateways;
  for (const auto& g : trusted_gateway_urls) gateways.emplace_back(g);

  jsonlite::Object o;
  o["trusted_node_url"] = trusted_node_url;
  o["trusted_gateway_urls"] = std::move(gateways);
  o["http_timeout_ms"] = http_timeout_ms;
  o["chunk_cache_dir"] = chunk_cache_dir;
  o["contiguous_data_dir"] = contiguous_data_dir;
  o["contiguous_data_compression"] = contiguous_data_compression;
  o["ans104_download_workers"] = ans104_download_workers;
  o["ans104_download_queue_size"] = ans104_download_queue_size;
  o["ans104_unbundle_workers"] = ans104_unbundle_workers;
  o["ans104_unbundle_queue_size"] = ans104_unbundle_queue_size;
  o["ans104_index_filter"] = ans104_index_filter;
  o["log_level"] = to_string(log_level);
  o["event_log"] = event_log_path;
  return jsonlite::to_json(jsonlite::Value(std::move(o)));
}

}  // namespace permagate
