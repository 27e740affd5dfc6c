#pragma once

// permagate/fs_chunk_cache.hpp — Content-addressed on-disk chunk caches.
//
// LAYOUT (stable across restarts):
//   <base>/<b64url(data_root)>/data/<relative_offset>      raw chunk bytes
//   <base>/<b64url(data_root)>/metadata/<relative_offset>  MessagePack map
//
// CONTRACT:
//   - has_*:  storage probe only; false on any error.
//   - get_*:  bytes or nullopt; storage errors are logged and read as a miss.
//   - set_*:  best effort; creates directories; failures are logged, never
//             thrown. Writes are tmp+rename, so racing writers of the same
//             key are harmless.
//   - get_*_by_absolute_or_relative_offset: cache first, then the upstream
//             source keyed by absolute offset. No write-back: callers that
//             want the fetched chunk cached call set_* themselves. Upstream
//             errors are logged and rethrown.
//
// Data and metadata are stored and looked up independently.

#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <string>

#include "permagate/chunk_source.hpp"
#include "permagate/log.hpp"

namespace permagate {

class FsChunkDataCache : public IChunkDataCache, public IChunkDataSource {
 public:
  FsChunkDataCache(const Logger& log, std::shared_ptr<IChunkDataSource> chunk_source,
                   std::string base_dir = "data/chunks");

  bool has_chunk_data(const std::string& data_root, uint64_t relative_offset) override;
  std::optional<std::string> get_chunk_data(const std::string& data_root,
                                            uint64_t relative_offset) override;
  void set_chunk_data(const std::string& data, const std::string& data_root,
                      uint64_t relative_offset) override;

  std::unique_ptr<std::istream> get_chunk_data_by_absolute_or_relative_offset(
      uint64_t absolute_offset, const std::string& data_root,
      uint64_t relative_offset) override;

  std::filesystem::path data_path(const std::string& data_root, uint64_t relative_offset) const;

 private:
  Logger log_;
  std::shared_ptr<IChunkDataSource> chunk_source_;
  std::filesystem::path base_dir_;
};

class FsChunkMetadataCache : public IChunkMetadataSource {
 public:
  FsChunkMetadataCache(const Logger& log, std::shared_ptr<IChunkSource> chunk_source,
                       std::string base_dir = "data/chunks");

  bool has_chunk_metadata(const std::string& data_root, uint64_t relative_offset);
  std::optional<ChunkMetadata> get_chunk_metadata(const std::string& data_root,
                                                  uint64_t relative_offset);
  // Keyed by (metadata.data_root, metadata.offset).
  void set_chunk_metadata(const ChunkMetadata& metadata);

  // On a miss the record is rebuilt from a full upstream chunk:
  // data_size = chunk length, offset = relative_offset.
  ChunkMetadata get_chunk_metadata_by_absolute_or_relative_offset(
      uint64_t absolute_offset, const std::string& data_root,
      uint64_t relative_offset) override;

  std::filesystem::path metadata_path(const std::string& data_root,
                                      uint64_t relative_offset) const;

 private:
  Logger log_;
  std::shared_ptr<IChunkSource> chunk_source_;
  std::filesystem::path base_dir_;
};

}  // namespace permagate
