#include "permagate/data_source.hpp"

#include <exception>
#include <fstream>
#include <streambuf>

#include "permagate/fs_util.hpp"
#include "permagate/observability.hpp"

namespace permagate {

namespace {

// Lazily pulls consecutive chunks of one transaction.
class TxChunkStreamBuf : public std::streambuf {
 public:
  TxChunkStreamBuf(std::shared_ptr<IChunkDataSource> chunks,
                   std::shared_ptr<IChunkDataCache> write_back, TxChunkInfo info)
      : chunks_(std::move(chunks)), write_back_(std::move(write_back)), info_(std::move(info)) {}

 protected:
  int_type underflow() override {
    if (gptr() < egptr()) return traits_type::to_int_type(*gptr());
    if (position_ >= info_.size) return traits_type::eof();

    const uint64_t absolute = info_.start_offset() + position_;
    const bool had = write_back_ && write_back_->has_chunk_data(info_.data_root, position_);
    auto stream = chunks_->get_chunk_data_by_absolute_or_relative_offset(
        absolute, info_.data_root, position_);
    if (!stream) {
      throw GatewayError(ErrorCode::upstream_unavailable,
                         "no chunk stream at offset " + std::to_string(absolute));
    }
    buffer_ = read_stream(*stream);
    if (buffer_.empty()) {
      throw GatewayError(ErrorCode::upstream_unavailable,
                         "empty chunk at offset " + std::to_string(absolute));
    }
    if (write_back_ && !had) write_back_->set_chunk_data(buffer_, info_.data_root, position_);

    const uint64_t remaining = info_.size - position_;
    if (buffer_.size() > remaining) buffer_.resize(static_cast<size_t>(remaining));
    position_ += buffer_.size();

    char* base = buffer_.data();
    setg(base, base, base + buffer_.size());
    return traits_type::to_int_type(*gptr());
  }

 private:
  std::shared_ptr<IChunkDataSource> chunks_;
  std::shared_ptr<IChunkDataCache> write_back_;
  TxChunkInfo info_;
  uint64_t position_{0};
  std::string buffer_;
};

class TxChunkStream : public std::istream {
 public:
  TxChunkStream(std::shared_ptr<IChunkDataSource> chunks,
                std::shared_ptr<IChunkDataCache> write_back, TxChunkInfo info)
      : std::istream(nullptr), buf_(std::move(chunks), std::move(write_back), std::move(info)) {
    rdbuf(&buf_);
    // Rethrow streambuf failures as-is instead of only setting badbit.
    exceptions(std::ios::badbit);
  }

 private:
  TxChunkStreamBuf buf_;
};

}  // namespace

// ---------------------------------------------------------------------------
// ChainedDataSource
// ---------------------------------------------------------------------------

ChainedDataSource::ChainedDataSource(
    const Logger& log, std::vector<std::shared_ptr<IContiguousDataSource>> sources)
    : log_(log.child("ChainedDataSource")), sources_(std::move(sources)) {}

DataSourceResult ChainedDataSource::get_data(const std::string& id) {
  std::exception_ptr last_error;
  for (size_t i = 0; i < sources_.size(); ++i) {
    try {
      DataSourceResult result = sources_[i]->get_data(id);
      if (result.stream) return result;
      log_.warn("Data source returned no stream", {{"id", id}, {"source", std::to_string(i)}});
    } catch (const std::exception& e) {
      last_error = std::current_exception();
      log_.warn("Unable to fetch data from source",
                {{"id", id}, {"source", std::to_string(i)}, {"message", e.what()}});
    }
  }
  if (last_error) std::rethrow_exception(last_error);
  throw GatewayError(ErrorCode::no_data_source, "no data source available for " + id);
}

// ---------------------------------------------------------------------------
// GatewayDataSource
// ---------------------------------------------------------------------------

GatewayDataSource::GatewayDataSource(const Logger& log, std::shared_ptr<IHttpClient> http,
                                     std::vector<std::string> gateway_urls,
                                     std::filesystem::path spool_dir)
    : log_(log.child("GatewayDataSource")),
      http_(std::move(http)),
      gateway_urls_(std::move(gateway_urls)),
      spool_dir_(std::move(spool_dir)) {
  for (auto& url : gateway_urls_) {
    while (!url.empty() && url.back() == '/') url.pop_back();
  }
}

DataSourceResult GatewayDataSource::get_data(const std::string& id) {
  std::exception_ptr last_error;
  for (const auto& gateway : gateway_urls_) {
    const std::string url = gateway + "/raw/" + id;
    try {
      std::filesystem::create_directories(spool_dir_);
      ScopedTempFile spool(temp_path_in(spool_dir_));
      long status = 0;
      {
        std::ofstream body(spool.path(), std::ios::binary | std::ios::trunc);
        if (!body) {
          throw GatewayError(ErrorCode::io_error, "cannot open spool file " + spool.path().string());
        }
        status = http_->get_to(url, body);
        body.close();
        if (!body) {
          throw GatewayError(ErrorCode::io_error, "short write to " + spool.path().string());
        }
      }
      if (status != 200) {
        throw GatewayError(status == 404 ? ErrorCode::not_found : ErrorCode::http_error,
                           "GET " + url + " returned " + std::to_string(status));
      }
      const uint64_t size = std::filesystem::file_size(spool.path());
      auto stream = std::make_unique<std::ifstream>(spool.path(), std::ios::binary);
      if (!*stream) {
        throw GatewayError(ErrorCode::io_error, "cannot reopen spool file " + spool.path().string());
      }
      log_.debug("Fetched data from trusted gateway", {{"id", id}, {"gateway", gateway}});
      global_pipeline_stats().bytes_from_network.fetch_add(size, std::memory_order_relaxed);
      DataSourceResult result;
      result.size = size;
      result.stream = std::move(stream);
      return result;
    } catch (const std::exception& e) {
      last_error = std::current_exception();
      log_.warn("Trusted gateway request failed",
                {{"id", id}, {"gateway", gateway}, {"message", e.what()}});
    }
  }
  if (last_error) std::rethrow_exception(last_error);
  throw GatewayError(ErrorCode::no_data_source, "no trusted gateways configured");
}

// ---------------------------------------------------------------------------
// TxChunksDataSource
// ---------------------------------------------------------------------------

TxChunksDataSource::TxChunksDataSource(const Logger& log,
                                       std::shared_ptr<ITxInfoSource> tx_info,
                                       std::shared_ptr<IChunkDataSource> chunks,
                                       std::shared_ptr<IChunkDataCache> write_back)
    : log_(log.child("TxChunksDataSource")),
      tx_info_(std::move(tx_info)),
      chunks_(std::move(chunks)),
      write_back_(std::move(write_back)) {}

DataSourceResult TxChunksDataSource::get_data(const std::string& id) {
  TxChunkInfo info = tx_info_->get_tx_chunk_info(id);
  log_.debug("Fetching data from chunks",
             {{"id", id},
              {"size", std::to_string(info.size)},
              {"startOffset", std::to_string(info.start_offset())}});

  DataSourceResult result;
  result.size = info.size;
  result.stream = std::make_unique<TxChunkStream>(chunks_, write_back_, std::move(info));
  return result;
}

// ---------------------------------------------------------------------------
// ReadThroughDataCache
// ---------------------------------------------------------------------------

ReadThroughDataCache::ReadThroughDataCache(const Logger& log,
                                           std::shared_ptr<FsDataStore> store,
                                           std::shared_ptr<IContiguousDataSource> upstream,
                                           std::string compression)
    : log_(log.child("ReadThroughDataCache")),
      store_(std::move(store)),
      upstream_(std::move(upstream)),
      compression_(std::move(compression)) {}

DataSourceResult ReadThroughDataCache::get_data(const std::string& id) {
  auto& stats = global_pipeline_stats();

  if (auto stored = store_->open_by_id(id)) {
    stats.data_cache_hits.fetch_add(1, std::memory_order_relaxed);
    stats.bytes_from_cache.fetch_add(stored->info.original_size, std::memory_order_relaxed);
    log_.debug("Serving data from local store", {{"id", id}});
    DataSourceResult result;
    result.size = stored->info.original_size;
    result.cached = true;
    result.stream = std::move(stored->stream);
    return result;
  }
  stats.data_cache_misses.fetch_add(1, std::memory_order_relaxed);

  DataSourceResult upstream = upstream_->get_data(id);
  const auto digest = store_->put(*upstream.stream, compression_, upstream.size);
  if (digest) {
    if (!store_->link_id(id, *digest)) {
      log_.warn("Unable to link content id", {{"id", id}, {"digest", *digest}});
    }
    if (auto stored = store_->open(*digest)) {
      DataSourceResult result;
      result.size = stored->info.original_size;
      result.verified = upstream.verified;
      result.stream = std::move(stored->stream);
      return result;
    }
  }

  log_.warn("Unable to store data locally, requesting it again", {{"id", id}});
  return upstream_->get_data(id);
}

}  // namespace permagate
