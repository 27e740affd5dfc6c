#pragma once

// permagate/data_source.hpp — Whole-object (contiguous) data retrieval.
//
// CONTRACT (all sources):
//   get_data(id) returns a DataSourceResult whose stream is finite and
//   single-pass, or throws. A source never retries itself; falling back is
//   ChainedDataSource's job and retrying is the caller's.
//
// Default composition (see cli.cpp):
//   ReadThroughDataCache(FsDataStore,
//     ChainedDataSource[GatewayDataSource(peers), TxChunksDataSource(node)])
//
// No source holds a whole object in memory: peer responses are spooled to
// an unlinked temp file, chunk reassembly pulls one chunk at a time, and the
// read-through cache tees a miss into the store before serving it from disk.

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "permagate/chunk_source.hpp"
#include "permagate/data_store.hpp"
#include "permagate/http_client.hpp"
#include "permagate/log.hpp"
#include "permagate/types.hpp"

namespace permagate {

class IContiguousDataSource {
 public:
  virtual ~IContiguousDataSource() = default;
  virtual DataSourceResult get_data(const std::string& id) = 0;
};

// ---------------------------------------------------------------------------
// ChainedDataSource
// ---------------------------------------------------------------------------
// Tries each source once, in order; the first returned stream wins. When all
// fail, rethrows the last error, or GatewayError(no_data_source) when there
// was none to rethrow. Caches nothing.
class ChainedDataSource : public IContiguousDataSource {
 public:
  ChainedDataSource(const Logger& log,
                    std::vector<std::shared_ptr<IContiguousDataSource>> sources);

  DataSourceResult get_data(const std::string& id) override;

 private:
  Logger log_;
  std::vector<std::shared_ptr<IContiguousDataSource>> sources_;
};

// ---------------------------------------------------------------------------
// GatewayDataSource — trusted peer gateways, GET <peer>/raw/<id>
// ---------------------------------------------------------------------------
// The body is written to a temp file under `spool_dir`, which is unlinked
// as soon as the returned stream has it open.
class GatewayDataSource : public IContiguousDataSource {
 public:
  GatewayDataSource(const Logger& log, std::shared_ptr<IHttpClient> http,
                    std::vector<std::string> gateway_urls,
                    std::filesystem::path spool_dir = std::filesystem::temp_directory_path());

  DataSourceResult get_data(const std::string& id) override;

 private:
  Logger log_;
  std::shared_ptr<IHttpClient> http_;
  std::vector<std::string> gateway_urls_;
  std::filesystem::path spool_dir_;
};

// ---------------------------------------------------------------------------
// TxChunksDataSource — reassembles a transaction from its chunks
// ---------------------------------------------------------------------------
// The returned stream pulls chunks lazily as it is read, addressing chunk n
// at absolute offset (tx start + position) and relative offset (position).
// When `write_back` is set, chunks it did not already hold are stored in it.
// A chunk failure surfaces as the original GatewayError from the stream read.
class TxChunksDataSource : public IContiguousDataSource {
 public:
  TxChunksDataSource(const Logger& log, std::shared_ptr<ITxInfoSource> tx_info,
                     std::shared_ptr<IChunkDataSource> chunks,
                     std::shared_ptr<IChunkDataCache> write_back = nullptr);

  DataSourceResult get_data(const std::string& id) override;

 private:
  Logger log_;
  std::shared_ptr<ITxInfoSource> tx_info_;
  std::shared_ptr<IChunkDataSource> chunks_;
  std::shared_ptr<IChunkDataCache> write_back_;
};

// ---------------------------------------------------------------------------
// ReadThroughDataCache — local store in front of an upstream source
// ---------------------------------------------------------------------------
// Hit: stream over the stored object, cached=true. Miss: streams upstream
// into the store, links the id, and serves the stored copy. An upstream
// stream that ends short of its declared size throws upstream_unavailable
// and stores nothing. When the store cannot take the object the upstream
// stream is already spent, so the id is requested from upstream once more
// and that stream is returned uncached.
class ReadThroughDataCache : public IContiguousDataSource {
 public:
  ReadThroughDataCache(const Logger& log, std::shared_ptr<FsDataStore> store,
                       std::shared_ptr<IContiguousDataSource> upstream,
                       std::string compression = "off");

  DataSourceResult get_data(const std::string& id) override;

 private:
  Logger log_;
  std::shared_ptr<FsDataStore> store_;
  std::shared_ptr<IContiguousDataSource> upstream_;
  std::string compression_;
};

}  // namespace permagate
