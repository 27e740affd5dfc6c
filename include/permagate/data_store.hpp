#pragma once

// permagate/data_store.hpp — Local whole-object store.
//
// LAYOUT:
//   <root>/objects/AB/CD/<digest>        stored bytes (identity or zstd)
//   <root>/objects/AB/CD/<digest>.meta   JSON sidecar (encoding, sizes)
//   <root>/ids/<content id>              digest of the object for that id
//   <root>/tmp/                          objects still being written
//
// DESIGN INVARIANTS:
//   1. Key = BLAKE3("cas:" || original bytes), hex. Two ids with identical
//      bytes share one object.
//   2. put() streams its input into tmp/ while hashing and compressing it,
//      then renames into objects/. The blob lands before its .meta and the
//      id link lands last, so a visible id always resolves to a complete
//      object. No object is ever held whole in memory.
//   3. open() verifies the content digest and size in a streaming pass
//      before handing out a stream; a mismatch reads as absent, never as
//      corrupted bytes.
//   4. put() of content already stored (and still verifying) keeps the
//      existing object and returns its digest.
//
// Local I/O failures are logged and reported as nullopt/false. put() lets
// exceptions from its input stream through, and throws
// GatewayError(upstream_unavailable) when the input ends short of
// `expected_size`.
//
// EXTENSION_POINT: retention
//   Objects are never evicted. A sweeper can walk objects/ by .meta
//   created_at; it must unlink ids/ entries before removing their objects.

#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <string>

#include "permagate/log.hpp"

namespace permagate {

struct StoredObjectInfo {
  std::string digest;
  std::string encoding{"identity"};
  uint64_t original_size{0};
  uint64_t stored_size{0};
  uint64_t created_at_unix_ts{0};
};

// The stream yields the original (decompressed) bytes.
struct StoredObject {
  StoredObjectInfo info;
  std::unique_ptr<std::istream> stream;
};

class FsDataStore {
 public:
  FsDataStore(const Logger& log, std::string root);

  // Consumes `in` to EOF. compression: "off" or "zstd". Returns the digest,
  // nullopt when the store could not write the object.
  std::optional<std::string> put(std::istream& in, const std::string& compression = "off",
                                 std::optional<uint64_t> expected_size = std::nullopt);

  std::optional<StoredObject> open(const std::string& digest) const;
  std::optional<StoredObjectInfo> info(const std::string& digest) const;
  bool contains(const std::string& digest) const;

  // Content id index.
  bool link_id(const std::string& id, const std::string& digest);
  std::optional<std::string> resolve_id(const std::string& id) const;
  std::optional<StoredObject> open_by_id(const std::string& id) const;

  const std::filesystem::path& root() const { return root_; }

 private:
  std::filesystem::path object_path(const std::string& digest) const;
  std::filesystem::path meta_path(const std::string& digest) const;
  std::filesystem::path id_path(const std::string& id) const;
  bool verify(const StoredObjectInfo& info) const;

  Logger log_;
  std::filesystem::path root_;
};

}  // namespace permagate
