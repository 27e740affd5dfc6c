#pragma once

// permagate/types.hpp — Core data structures for the gateway retrieval core.
//
// IDENTIFIERS:
//   - Content ids (transactions, bundles, data items) travel as 43-char
//     base64url strings, the form clients and upstream gateways use.
//   - Data roots travel as raw 32-byte strings. Filesystem paths derived from
//     them use base64url (see fs_chunk_cache.cpp).
//   - Binary payloads are std::string (byte-owning, no borrowed views).
//
// MEMORY OWNERSHIP:
//   - All value types below own their members.
//   - DataSourceResult owns its stream exclusively. The stream is single-pass:
//     a consumer that needs the bytes again must re-request them from the
//     source. Nothing in this codebase seeks a DataSourceResult stream.
//
// EXTENSION_POINT: nested_bundle_unbundling
//   DataItem carries enough (root_tx_id, data_offset, data_size) for a future
//   data source that serves items out of their parent; once it exists, items
//   tagged Bundle-Format=binary can be fed back into the importer.

#include <cstdint>
#include <istream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace permagate {

enum class ErrorCode {
  none,
  not_found,
  http_error,
  upstream_unavailable,
  io_error,
  bundle_parse_error,
  bundle_truncated,
  checksum_mismatch,
  filter_invalid,
  config_invalid,
  no_data_source,
};

std::string to_string(ErrorCode code);

// Thrown by data sources, chunk sources and the bundle parser.
class GatewayError : public std::runtime_error {
 public:
  GatewayError(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  ErrorCode code() const noexcept { return code_; }

 private:
  ErrorCode code_;
};

// A (name, value) pair as stored in the bundle; both are raw bytes.
using Tag = std::pair<std::string, std::string>;
using Tags = std::vector<Tag>;

// ---------------------------------------------------------------------------
// DataItem — one unit extracted from a bundle
// ---------------------------------------------------------------------------
// Produced only by the unbundler. Ownership moves to the sink on emission.
struct DataItem {
  std::string id;               // base64url SHA-256(signature)
  uint64_t index{0};            // position inside the parent bundle
  std::string parent_id;        // bundle the item was read from
  std::string root_tx_id;       // outermost transaction (== parent for L1 bundles)
  uint64_t offset{0};           // item start, relative to parent start
  uint64_t size{0};             // item length including its header
  uint64_t data_offset{0};      // payload start, relative to parent start
  uint64_t data_size{0};
  uint16_t signature_type{0};
  std::string owner_address;    // base64url SHA-256(owner)
  std::string target;           // base64url, empty when absent
  std::string anchor;           // base64url, empty when absent
  Tags tags;
};

// Work unit for the importer and unbundler queues.
struct BundleItem {
  std::string id;
  uint64_t index{0};
  std::string root_tx_id;

  bool operator==(const BundleItem& other) const {
    return id == other.id && index == other.index &&
           root_tx_id == other.root_tx_id;
  }
};

// ---------------------------------------------------------------------------
// Chunks
// ---------------------------------------------------------------------------
// (data_root, offset) identifies metadata uniquely. Rewriting identical
// metadata at the same key is a no-op in effect.
struct ChunkMetadata {
  std::string data_root;   // raw 32 bytes
  uint64_t data_size{0};
  uint64_t offset{0};      // relative to the start of the object
  std::string data_path;   // opaque Merkle proof bytes

  bool operator==(const ChunkMetadata& other) const {
    return data_root == other.data_root && data_size == other.data_size &&
           offset == other.offset && data_path == other.data_path;
  }
};

// Full upstream chunk response.
struct Chunk {
  std::string chunk;       // payload bytes
  std::string data_path;   // proof bytes
  std::string tx_path;     // proof of the transaction in its block, may be empty
};

// ---------------------------------------------------------------------------
// DataSourceResult — whole-object retrieval
// ---------------------------------------------------------------------------
struct DataSourceResult {
  std::unique_ptr<std::istream> stream;  // finite, single-pass
  uint64_t size{0};
  bool verified{false};  // integrity checked by the producing source
  bool cached{false};    // served from local storage
};

// Transaction location on the weave, as reported by a trusted node.
struct TxChunkInfo {
  std::string data_root;  // raw 32 bytes
  uint64_t size{0};
  uint64_t end_offset{0};  // absolute offset of the last byte

  uint64_t start_offset() const { return end_offset - size + 1; }
};

}  // namespace permagate
