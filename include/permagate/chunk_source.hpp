#pragma once

// permagate/chunk_source.hpp — Upstream chunk interfaces.
//
// ADDRESSING:
//   Upstream sources are addressed by absolute weave offset (their native
//   key). Caches are addressed by (data_root, relative_offset), which does not
//   depend on where the object sits on the weave. Every call carries both so
//   each layer can use the one it needs.
//
// Thread-safety: implementations MUST be safe for concurrent calls; worker
// pools call them from several threads at once.

#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <string>

#include "permagate/types.hpp"

namespace permagate {

// Full chunk (payload + proofs). Throws GatewayError on failure.
class IChunkSource {
 public:
  virtual ~IChunkSource() = default;
  virtual Chunk get_chunk_by_absolute_or_relative_offset(
      uint64_t absolute_offset, const std::string& data_root,
      uint64_t relative_offset) = 0;
};

// Chunk payload only, as a single-pass stream. Throws GatewayError on failure.
class IChunkDataSource {
 public:
  virtual ~IChunkDataSource() = default;
  virtual std::unique_ptr<std::istream> get_chunk_data_by_absolute_or_relative_offset(
      uint64_t absolute_offset, const std::string& data_root,
      uint64_t relative_offset) = 0;
};

class IChunkMetadataSource {
 public:
  virtual ~IChunkMetadataSource() = default;
  virtual ChunkMetadata get_chunk_metadata_by_absolute_or_relative_offset(
      uint64_t absolute_offset, const std::string& data_root,
      uint64_t relative_offset) = 0;
};

// Local chunk payload store. Never throws: errors read as a miss.
class IChunkDataCache {
 public:
  virtual ~IChunkDataCache() = default;
  virtual bool has_chunk_data(const std::string& data_root, uint64_t relative_offset) = 0;
  virtual std::optional<std::string> get_chunk_data(const std::string& data_root,
                                                    uint64_t relative_offset) = 0;
  virtual void set_chunk_data(const std::string& data, const std::string& data_root,
                              uint64_t relative_offset) = 0;
};

// Transaction placement lookups (data root, size, end offset).
class ITxInfoSource {
 public:
  virtual ~ITxInfoSource() = default;
  virtual TxChunkInfo get_tx_chunk_info(const std::string& id) = 0;
};

}  // namespace permagate
