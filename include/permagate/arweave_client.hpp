#pragma once

// permagate/arweave_client.hpp — Trusted Arweave node client.
//
// Endpoints used:
//   GET <node>/chunk/<absolute_offset>  {"chunk","data_path","tx_path"} (b64url)
//   GET <node>/tx/<id>/offset           {"size":"..","offset":".."}
//   GET <node>/tx/<id>/data_root        b64url text
//
// A node answers chunk requests by absolute weave offset only; data_root and
// relative_offset are carried for logging.

#include <memory>
#include <string>

#include "permagate/chunk_source.hpp"
#include "permagate/http_client.hpp"
#include "permagate/log.hpp"

namespace permagate {

class ArweaveChunkSource : public IChunkSource,
                           public IChunkDataSource,
                           public ITxInfoSource {
 public:
  ArweaveChunkSource(const Logger& log, std::shared_ptr<IHttpClient> http,
                     std::string node_url);

  Chunk get_chunk_by_absolute_or_relative_offset(uint64_t absolute_offset,
                                                 const std::string& data_root,
                                                 uint64_t relative_offset) override;

  std::unique_ptr<std::istream> get_chunk_data_by_absolute_or_relative_offset(
      uint64_t absolute_offset, const std::string& data_root,
      uint64_t relative_offset) override;

  TxChunkInfo get_tx_chunk_info(const std::string& id) override;

 private:
  std::string fetch(const std::string& path, const std::string& what);

  Logger log_;
  std::shared_ptr<IHttpClient> http_;
  std::string node_url_;
};

}  // namespace permagate
