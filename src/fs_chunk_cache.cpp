#include "permagate/fs_chunk_cache.hpp"

#include <sstream>

#include "permagate/encoding.hpp"
#include "permagate/fs_util.hpp"
#include "permagate/observability.hpp"

namespace fs = std::filesystem;

namespace permagate {

namespace {

fs::path chunk_dir(const fs::path& base, const std::string& data_root, const char* kind) {
  return base / to_b64url(data_root) / kind;
}

bool probe(const fs::path& p) {
  std::error_code ec;
  return fs::exists(p, ec) && !ec;
}

LogFields key_fields(const std::string& data_root, uint64_t relative_offset) {
  return {{"dataRoot", to_b64url(data_root)},
          {"relativeOffset", std::to_string(relative_offset)}};
}

LogFields error_fields(const std::string& data_root, uint64_t relative_offset,
                       const std::exception& e) {
  auto f = key_fields(data_root, relative_offset);
  f.emplace_back("message", e.what());
  return f;
}

}  // namespace

// ---------------------------------------------------------------------------
// FsChunkDataCache
// ---------------------------------------------------------------------------

FsChunkDataCache::FsChunkDataCache(const Logger& log,
                                   std::shared_ptr<IChunkDataSource> chunk_source,
                                   std::string base_dir)
    : log_(log.child("FsChunkDataCache")),
      chunk_source_(std::move(chunk_source)),
      base_dir_(std::move(base_dir)) {}

fs::path FsChunkDataCache::data_path(const std::string& data_root,
                                     uint64_t relative_offset) const {
  return chunk_dir(base_dir_, data_root, "data") / std::to_string(relative_offset);
}

bool FsChunkDataCache::has_chunk_data(const std::string& data_root, uint64_t relative_offset) {
  return probe(data_path(data_root, relative_offset));
}

std::optional<std::string> FsChunkDataCache::get_chunk_data(const std::string& data_root,
                                                            uint64_t relative_offset) {
  try {
    if (has_chunk_data(data_root, relative_offset)) {
      return read_file(data_path(data_root, relative_offset));
    }
  } catch (const std::exception& e) {
    log_.error("Failed to fetch chunk data from cache",
               error_fields(data_root, relative_offset, e));
  }
  return std::nullopt;
}

void FsChunkDataCache::set_chunk_data(const std::string& data, const std::string& data_root,
                                      uint64_t relative_offset) {
  try {
    atomic_write(data_path(data_root, relative_offset), data);
    log_.info("Successfully cached chunk data", key_fields(data_root, relative_offset));
  } catch (const std::exception& e) {
    global_pipeline_stats().chunk_data_write_failures.fetch_add(1, std::memory_order_relaxed);
    log_.error("Failed to set chunk data in cache",
               error_fields(data_root, relative_offset, e));
  }
}

std::unique_ptr<std::istream> FsChunkDataCache::get_chunk_data_by_absolute_or_relative_offset(
    uint64_t absolute_offset, const std::string& data_root, uint64_t relative_offset) {
  auto& stats = global_pipeline_stats();
  try {
    if (auto cached = get_chunk_data(data_root, relative_offset)) {
      stats.chunk_data_hits.fetch_add(1, std::memory_order_relaxed);
      log_.info("Successfully fetched chunk data from cache",
                key_fields(data_root, relative_offset));
      return std::make_unique<std::istringstream>(std::move(*cached));
    }
    stats.chunk_data_misses.fetch_add(1, std::memory_order_relaxed);
    return chunk_source_->get_chunk_data_by_absolute_or_relative_offset(
        absolute_offset, data_root, relative_offset);
  } catch (const std::exception& e) {
    auto f = error_fields(data_root, relative_offset, e);
    f.emplace_back("absoluteOffset", std::to_string(absolute_offset));
    log_.error("Failed to fetch chunk data", f);
    throw;
  }
}

// ---------------------------------------------------------------------------
// FsChunkMetadataCache
// ---------------------------------------------------------------------------

FsChunkMetadataCache::FsChunkMetadataCache(const Logger& log,
                                           std::shared_ptr<IChunkSource> chunk_source,
                                           std::string base_dir)
    : log_(log.child("FsChunkMetadataCache")),
      chunk_source_(std::move(chunk_source)),
      base_dir_(std::move(base_dir)) {}

fs::path FsChunkMetadataCache::metadata_path(const std::string& data_root,
                                             uint64_t relative_offset) const {
  return chunk_dir(base_dir_, data_root, "metadata") / std::to_string(relative_offset);
}

bool FsChunkMetadataCache::has_chunk_metadata(const std::string& data_root,
                                              uint64_t relative_offset) {
  return probe(metadata_path(data_root, relative_offset));
}

std::optional<ChunkMetadata> FsChunkMetadataCache::get_chunk_metadata(
    const std::string& data_root, uint64_t relative_offset) {
  try {
    if (has_chunk_metadata(data_root, relative_offset)) {
      const auto bytes = read_file(metadata_path(data_root, relative_offset));
      auto metadata = chunk_metadata_from_msgpack(bytes);
      if (!metadata) {
        throw GatewayError(ErrorCode::io_error, "malformed chunk metadata record");
      }
      return metadata;
    }
  } catch (const std::exception& e) {
    log_.error("Failed to fetch chunk metadata from cache",
               error_fields(data_root, relative_offset, e));
  }
  return std::nullopt;
}

void FsChunkMetadataCache::set_chunk_metadata(const ChunkMetadata& metadata) {
  try {
    atomic_write(metadata_path(metadata.data_root, metadata.offset),
                 chunk_metadata_to_msgpack(metadata));
    log_.info("Successfully cached chunk metadata",
              key_fields(metadata.data_root, metadata.offset));
  } catch (const std::exception& e) {
    log_.error("Failed to set chunk metadata in cache",
               error_fields(metadata.data_root, metadata.offset, e));
  }
}

ChunkMetadata FsChunkMetadataCache::get_chunk_metadata_by_absolute_or_relative_offset(
    uint64_t absolute_offset, const std::string& data_root, uint64_t relative_offset) {
  auto& stats = global_pipeline_stats();
  try {
    if (auto cached = get_chunk_metadata(data_root, relative_offset)) {
      stats.chunk_metadata_hits.fetch_add(1, std::memory_order_relaxed);
      log_.info("Successfully fetched chunk metadata from cache",
                key_fields(data_root, relative_offset));
      return *cached;
    }
    stats.chunk_metadata_misses.fetch_add(1, std::memory_order_relaxed);
    const Chunk chunk = chunk_source_->get_chunk_by_absolute_or_relative_offset(
        absolute_offset, data_root, relative_offset);

    ChunkMetadata metadata;
    metadata.data_root = data_root;
    metadata.data_size = chunk.chunk.size();
    metadata.offset = relative_offset;
    metadata.data_path = chunk.data_path;
    return metadata;
  } catch (const std::exception& e) {
    auto f = error_fields(data_root, relative_offset, e);
    f.emplace_back("absoluteOffset", std::to_string(absolute_offset));
    log_.error("Failed to fetch chunk metadata", f);
    throw;
  }
}

}  // namespace permagate
