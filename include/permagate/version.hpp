#pragma once

// permagate/version.hpp — Version manifest for every on-disk and wire format.
//
// INVARIANT:
//   A change to any layout below bumps its constant. Stores written by an
//   older layout are never silently reinterpreted.
//
// EXTENSION_POINT: layout_migration
//   Current: constants are reported by `permagate health` only.
//   Upgrade path: write the constants into a FORMAT file at each store root
//   on first use and refuse to open a root whose FORMAT is newer than the
//   binary.

#include <cstdint>
#include <string>

namespace permagate {
namespace version {

// ---------------------------------------------------------------------------
// CHUNK_CACHE_LAYOUT_VERSION
// Version 1 = <base>/<b64url(data_root)>/{data,metadata}/<relative_offset>,
// metadata as a MessagePack map with named fields.
// ---------------------------------------------------------------------------
constexpr uint32_t CHUNK_CACHE_LAYOUT_VERSION = 1;

// ---------------------------------------------------------------------------
// DATA_STORE_FORMAT_VERSION
// Version 1 = objects/AB/CD/<blake3 digest> + JSON .meta sidecar, ids/<id>.
// ---------------------------------------------------------------------------
constexpr uint32_t DATA_STORE_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// HASH_ALGORITHM_VERSION
// Version 1 = BLAKE3 with the "cas:" domain prefix for local store keys.
// Network ids are SHA-256 and are not versioned here.
// ---------------------------------------------------------------------------
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

// ---------------------------------------------------------------------------
// ITEM_RECORD_VERSION
// Shape of JSONL data item records and pipeline events.
// ---------------------------------------------------------------------------
constexpr uint32_t ITEM_RECORD_VERSION = 1;

struct VersionManifest {
  uint32_t chunk_cache_layout{CHUNK_CACHE_LAYOUT_VERSION};
  uint32_t data_store_format{DATA_STORE_FORMAT_VERSION};
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  uint32_t item_record{ITEM_RECORD_VERSION};
  std::string semver;           // from the CMake project version
  std::string hash_primitive;   // "blake3"
  std::string build_timestamp;  // __DATE__ "T" __TIME__
};

VersionManifest current_manifest(const std::string& semver = "");

std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace permagate
