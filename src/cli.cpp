#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "permagate/ans104_unbundler.hpp"
#include "permagate/arweave_client.hpp"
#include "permagate/bundle_data_importer.hpp"
#include "permagate/config.hpp"
#include "permagate/data_source.hpp"
#include "permagate/data_store.hpp"
#include "permagate/encoding.hpp"
#include "permagate/filters.hpp"
#include "permagate/fs_chunk_cache.hpp"
#include "permagate/fs_util.hpp"
#include "permagate/hash.hpp"
#include "permagate/http_client.hpp"
#include "permagate/jsonlite.hpp"
#include "permagate/log.hpp"
#include "permagate/observability.hpp"
#include "permagate/version.hpp"

#ifndef PROJECT_VERSION
#define PROJECT_VERSION "0.1.0"
#endif

namespace fs = std::filesystem;

namespace {

// Everything a command may need, wired the default way:
// local store -> trusted gateways -> chunks from the trusted node.
struct Pipeline {
  std::shared_ptr<permagate::CurlHttpClient> http;
  std::shared_ptr<permagate::ArweaveChunkSource> node;
  std::shared_ptr<permagate::FsChunkDataCache> chunk_data;
  std::shared_ptr<permagate::FsChunkMetadataCache> chunk_metadata;
  std::shared_ptr<permagate::FsDataStore> store;
  std::shared_ptr<permagate::IContiguousDataSource> data_source;
};

Pipeline build_pipeline(const permagate::GatewayConfig& config, const permagate::Logger& log) {
  using namespace permagate;
  Pipeline p;
  p.http = std::make_shared<CurlHttpClient>(config.http_timeout_ms);
  p.node = std::make_shared<ArweaveChunkSource>(log, p.http, config.trusted_node_url);
  p.chunk_data = std::make_shared<FsChunkDataCache>(log, p.node, config.chunk_cache_dir);
  p.chunk_metadata = std::make_shared<FsChunkMetadataCache>(log, p.node, config.chunk_cache_dir);

  auto gateways = std::make_shared<GatewayDataSource>(
      log, p.http, config.trusted_gateway_urls,
      std::filesystem::path(config.contiguous_data_dir) / "tmp");
  auto tx_chunks = std::make_shared<TxChunksDataSource>(log, p.node, p.chunk_data, p.chunk_data);
  auto chain = std::make_shared<ChainedDataSource>(
      log, std::vector<std::shared_ptr<IContiguousDataSource>>{gateways, tx_chunks});

  p.store = std::make_shared<FsDataStore>(log, config.contiguous_data_dir);
  p.data_source = std::make_shared<ReadThroughDataCache>(log, p.store, chain,
                                                         config.contiguous_data_compression);
  return p;
}

uint64_t count_files(const fs::path& root, const std::string& parent_name) {
  std::error_code ec;
  if (!fs::is_directory(root, ec)) return 0;
  uint64_t n = 0;
  for (auto it = fs::recursive_directory_iterator(root, ec);
       !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (!it->is_regular_file(ec)) continue;
    const auto& p = it->path();
    if (p.filename().string().rfind(".tmp_", 0) == 0) continue;
    if (parent_name.empty() || p.parent_path().filename().string() == parent_name) ++n;
  }
  return n;
}

void print_error(const std::string& code, const std::string& message) {
  std::cerr << "{\"error\":\"" << permagate::jsonlite::escape(code)
            << "\",\"message\":\"" << permagate::jsonlite::escape(message) << "\"}\n";
}

int usage() {
  std::cerr << "usage: permagate [--config <file>] <command>\n"
               "  health\n"
               "  config\n"
               "  fetch <id> [--out <file>]\n"
               "  unbundle <id>... [--prioritized]\n"
               "  chunk <absoluteOffset> <dataRootB64> <relativeOffset>\n"
               "  stats\n";
  return 1;
}

uint64_t parse_offset(const std::string& text, const char* what) {
  if (text.empty() || text.size() > 19 ||
      text.find_first_not_of("0123456789") != std::string::npos) {
    throw permagate::GatewayError(permagate::ErrorCode::config_invalid,
                                  std::string(what) + " must be a non-negative integer");
  }
  return std::stoull(text);
}

int cmd_fetch(const Pipeline& p, const std::vector<std::string>& args) {
  using namespace permagate;
  std::string id;
  std::string out_path;
  for (size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--out" && i + 1 < args.size()) {
      out_path = args[++i];
    } else if (id.empty()) {
      id = args[i];
    }
  }
  if (id.empty()) return usage();

  DataSourceResult result = p.data_source->get_data(id);

  std::ofstream file;
  std::ostream* out = &std::cout;
  if (!out_path.empty()) {
    file.open(out_path, std::ios::binary | std::ios::trunc);
    if (!file) throw GatewayError(ErrorCode::io_error, "cannot open " + out_path);
    out = &file;
  }

  Sha256Hasher hasher;
  const uint64_t written = consume_stream(*result.stream, [&](const char* data, size_t n) {
    hasher.update(data, n);
    out->write(data, static_cast<std::streamsize>(n));
  });
  out->flush();
  if (!*out) throw GatewayError(ErrorCode::io_error, "failed writing fetched bytes");
  if (written != result.size) {
    throw GatewayError(ErrorCode::upstream_unavailable,
                       "received " + std::to_string(written) + " of " +
                           std::to_string(result.size) + " bytes");
  }

  std::cerr << "{\"id\":\"" << jsonlite::escape(id) << "\""
            << ",\"size\":" << written
            << ",\"sha256\":\"" << to_b64url(hasher.finalize()) << "\""
            << ",\"cached\":" << (result.cached ? "true" : "false")
            << ",\"verified\":" << (result.verified ? "true" : "false") << "}\n";
  return 0;
}

int cmd_unbundle(const permagate::GatewayConfig& config, const Pipeline& p,
                 const permagate::Logger& log, const std::vector<std::string>& args) {
  using namespace permagate;
  bool prioritized = false;
  std::vector<std::string> ids;
  for (const auto& a : args) {
    if (a == "--prioritized") {
      prioritized = true;
    } else {
      ids.push_back(a);
    }
  }
  if (ids.empty()) return usage();

  auto sink = std::make_shared<JsonlDataItemSink>(std::cout);
  auto unbundler = std::make_shared<Ans104Unbundler>(
      log, p.data_source, create_filter(config.ans104_index_filter), sink,
      UnbundlerOptions{config.ans104_unbundle_workers, config.ans104_unbundle_queue_size});
  BundleDataImporter importer(
      log, p.data_source, unbundler,
      ImporterOptions{config.ans104_download_workers, config.ans104_download_queue_size});

  for (const auto& id : ids) {
    importer.queue_item(BundleItem{id, 0, id}, prioritized);
  }
  importer.drain();
  unbundler->drain();

  std::cerr << global_pipeline_stats().to_json() << "\n";
  const auto& dl = importer.counters();
  const auto& ub = unbundler->counters();
  const bool ok = dl.failed.load() == 0 && ub.failed.load() == 0 && dl.dropped.load() == 0;
  return ok ? 0 : 2;
}

int cmd_chunk(const Pipeline& p, const std::vector<std::string>& args) {
  using namespace permagate;
  if (args.size() < 3) return usage();
  const uint64_t absolute_offset = parse_offset(args[0], "absoluteOffset");
  const auto data_root = from_b64url(args[1]);
  if (!data_root || data_root->size() != 32) {
    throw GatewayError(ErrorCode::config_invalid, "dataRoot must be 32 bytes of base64url");
  }
  const uint64_t relative_offset = parse_offset(args[2], "relativeOffset");

  const bool was_cached = p.chunk_data->has_chunk_data(*data_root, relative_offset);
  auto stream = p.chunk_data->get_chunk_data_by_absolute_or_relative_offset(
      absolute_offset, *data_root, relative_offset);
  const std::string bytes = read_stream(*stream);
  if (!was_cached) p.chunk_data->set_chunk_data(bytes, *data_root, relative_offset);

  const bool metadata_cached = p.chunk_metadata->has_chunk_metadata(*data_root, relative_offset);
  const ChunkMetadata metadata = p.chunk_metadata->get_chunk_metadata_by_absolute_or_relative_offset(
      absolute_offset, *data_root, relative_offset);
  if (!metadata_cached) p.chunk_metadata->set_chunk_metadata(metadata);

  std::cout << "{\"data_root\":\"" << to_b64url(*data_root) << "\""
            << ",\"relative_offset\":" << relative_offset
            << ",\"size\":" << bytes.size()
            << ",\"sha256\":\"" << sha256_b64url(bytes) << "\""
            << ",\"data_path_size\":" << metadata.data_path.size()
            << ",\"cached\":" << (was_cached ? "true" : "false") << "}\n";
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  std::optional<std::string> config_path;
  std::string cmd;
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (cmd.empty() && a == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (cmd.empty()) {
      cmd = a;
    } else {
      args.push_back(a);
    }
  }
  if (cmd.empty()) return usage();

  try {
    const permagate::GatewayConfig config = permagate::load_config(config_path);
    permagate::set_log_level(config.log_level);
    permagate::set_event_log_path(config.event_log_path);
    const permagate::Logger log("permagate");

    if (cmd == "health") {
      const auto h = permagate::hash_runtime_info();
      const auto manifest = permagate::version::current_manifest(PROJECT_VERSION);
      std::cout << "{\"version\":" << permagate::version::manifest_to_json(manifest)
                << ",\"blake3\":\"" << permagate::jsonlite::escape(h.blake3_version) << "\""
                << ",\"openssl\":\"" << permagate::jsonlite::escape(h.openssl_version) << "\""
                << ",\"curl\":\""
                << permagate::jsonlite::escape(permagate::CurlHttpClient::library_version())
                << "\""
                << ",\"compression_capabilities\":[\"identity\",\"zstd\"]"
                << "}\n";
      return 0;
    }

    if (cmd == "config") {
      std::cout << config.to_json() << "\n";
      return 0;
    }

    if (cmd == "stats") {
      std::cout << "{\"pipeline\":" << permagate::global_pipeline_stats().to_json()
                << ",\"chunk_cache\":{\"data_files\":"
                << count_files(config.chunk_cache_dir, "data")
                << ",\"metadata_files\":" << count_files(config.chunk_cache_dir, "metadata")
                << "},\"data_store\":{\"linked_ids\":"
                << count_files(fs::path(config.contiguous_data_dir) / "ids", "")
                << "}}\n";
      return 0;
    }

    const Pipeline pipeline = build_pipeline(config, log);
    if (cmd == "fetch") return cmd_fetch(pipeline, args);
    if (cmd == "unbundle") return cmd_unbundle(config, pipeline, log, args);
    if (cmd == "chunk") return cmd_chunk(pipeline, args);
    return usage();
  } catch (const permagate::GatewayError& e) {
    print_error(permagate::to_string(e.code()), e.what());
    return 2;
  } catch (const std::exception& e) {
    print_error("internal", e.what());
    return 2;
  }
}
