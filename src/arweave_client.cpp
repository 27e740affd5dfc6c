#include "permagate/arweave_client.hpp"

#include <sstream>

#include "permagate/encoding.hpp"
#include "permagate/jsonlite.hpp"
#include "permagate/observability.hpp"

namespace permagate {

namespace {

std::string trim(std::string s) {
  const auto b = s.find_first_not_of(" \t\r\n\"");
  const auto e = s.find_last_not_of(" \t\r\n\"");
  if (b == std::string::npos) return {};
  return s.substr(b, e - b + 1);
}

// The node reports sizes and offsets as decimal strings; accept bare numbers too.
uint64_t numeric_field(const jsonlite::Object& obj, const std::string& key) {
  const auto* v = jsonlite::find(obj, key);
  if (v) {
    if (const auto* n = std::get_if<std::uint64_t>(&v->v)) return *n;
    if (const auto* s = std::get_if<std::string>(&v->v)) {
      // 19 digits always fit in uint64.
      if (!s->empty() && s->size() <= 19 &&
          s->find_first_not_of("0123456789") == std::string::npos) {
        return std::stoull(*s);
      }
    }
  }
  throw GatewayError(ErrorCode::upstream_unavailable,
                     "tx offset response has no usable '" + key + "'");
}

std::string b64_field(const jsonlite::Object& obj, const std::string& key, bool required) {
  const std::string text = jsonlite::get_string(obj, key);
  if (text.empty()) {
    if (required) {
      throw GatewayError(ErrorCode::upstream_unavailable,
                         "chunk response is missing '" + key + "'");
    }
    return {};
  }
  auto bytes = from_b64url(text);
  if (!bytes) {
    throw GatewayError(ErrorCode::upstream_unavailable,
                       "chunk response field '" + key + "' is not base64url");
  }
  return std::move(*bytes);
}

}  // namespace

ArweaveChunkSource::ArweaveChunkSource(const Logger& log, std::shared_ptr<IHttpClient> http,
                                       std::string node_url)
    : log_(log.child("ArweaveChunkSource")),
      http_(std::move(http)),
      node_url_(std::move(node_url)) {
  while (!node_url_.empty() && node_url_.back() == '/') node_url_.pop_back();
}

std::string ArweaveChunkSource::fetch(const std::string& path, const std::string& what) {
  const std::string url = node_url_ + path;
  const HttpResponse resp = http_->get(url);
  if (resp.status == 404) {
    throw GatewayError(ErrorCode::not_found, what + " not found at " + url);
  }
  if (resp.status != 200) {
    throw GatewayError(ErrorCode::http_error,
                       what + " request to " + url + " returned " + std::to_string(resp.status));
  }
  return resp.body;
}

Chunk ArweaveChunkSource::get_chunk_by_absolute_or_relative_offset(
    uint64_t absolute_offset, const std::string& data_root, uint64_t relative_offset) {
  log_.debug("Fetching chunk",
             {{"absoluteOffset", std::to_string(absolute_offset)},
              {"dataRoot", to_b64url(data_root)},
              {"relativeOffset", std::to_string(relative_offset)}});

  const std::string body = fetch("/chunk/" + std::to_string(absolute_offset), "chunk");
  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(body, &err);
  if (err) {
    throw GatewayError(ErrorCode::upstream_unavailable,
                       "chunk response is not a JSON object: " + err->message);
  }

  Chunk chunk;
  chunk.chunk = b64_field(obj, "chunk", true);
  chunk.data_path = b64_field(obj, "data_path", true);
  chunk.tx_path = b64_field(obj, "tx_path", false);
  global_pipeline_stats().bytes_from_network.fetch_add(chunk.chunk.size(),
                                                       std::memory_order_relaxed);
  return chunk;
}

std::unique_ptr<std::istream> ArweaveChunkSource::get_chunk_data_by_absolute_or_relative_offset(
    uint64_t absolute_offset, const std::string& data_root, uint64_t relative_offset) {
  Chunk chunk = get_chunk_by_absolute_or_relative_offset(absolute_offset, data_root,
                                                         relative_offset);
  return std::make_unique<std::istringstream>(std::move(chunk.chunk));
}

TxChunkInfo ArweaveChunkSource::get_tx_chunk_info(const std::string& id) {
  std::optional<jsonlite::JsonError> err;
  const auto offset = jsonlite::parse(fetch("/tx/" + id + "/offset", "tx offset"), &err);
  if (err) {
    throw GatewayError(ErrorCode::upstream_unavailable,
                       "tx offset response is not a JSON object: " + err->message);
  }

  const std::string root_text = trim(fetch("/tx/" + id + "/data_root", "tx data_root"));
  auto data_root = from_b64url(root_text);
  if (!data_root || data_root->size() != 32) {
    throw GatewayError(ErrorCode::upstream_unavailable,
                       "tx data_root response is not a 32-byte base64url value");
  }

  TxChunkInfo info;
  info.data_root = std::move(*data_root);
  info.size = numeric_field(offset, "size");
  info.end_offset = numeric_field(offset, "offset");
  if (info.size == 0 || info.size > info.end_offset + 1) {
    throw GatewayError(ErrorCode::upstream_unavailable,
                       "tx offset response is inconsistent for " + id);
  }
  return info;
}

}  // namespace permagate
