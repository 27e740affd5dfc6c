#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace permagate {

// BLAKE3 — content digests for the local object store.
std::string blake3_hex(std::string_view payload);

// Domain-separated hashing. The "cas:" domain keys the local object store.
std::string hash_domain(std::string_view domain, std::string_view payload);
std::string cas_content_hash(std::string_view raw_bytes);

// Incremental BLAKE3 for objects streamed into the store. The domain is fed
// ahead of the payload, so Blake3Hasher("cas:") over a stream yields the same
// digest as cas_content_hash over the whole buffer.
class Blake3Hasher {
 public:
  explicit Blake3Hasher(std::string_view domain = {});
  ~Blake3Hasher();
  Blake3Hasher(const Blake3Hasher&) = delete;
  Blake3Hasher& operator=(const Blake3Hasher&) = delete;

  void update(const char* data, std::size_t len);
  std::string finalize_hex() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

// SHA-256 (OpenSSL EVP) — the network's own identifier scheme.
// Data item id = SHA-256(signature); owner address = SHA-256(owner).
std::string sha256_bytes(std::string_view payload);
std::string sha256_b64url(std::string_view payload);

struct HashRuntimeInfo {
  std::string blake3_version;
  std::string openssl_version;
};

HashRuntimeInfo hash_runtime_info();

// Incremental SHA-256 for streamed payloads (CLI fetch digests).
class Sha256Hasher {
 public:
  Sha256Hasher();
  ~Sha256Hasher();
  Sha256Hasher(const Sha256Hasher&) = delete;
  Sha256Hasher& operator=(const Sha256Hasher&) = delete;

  void update(const char* data, std::size_t len);
  std::string finalize();  // 32 raw bytes

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace permagate
