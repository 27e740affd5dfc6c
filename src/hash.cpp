#include "permagate/hash.hpp"

// Hash authority.
//
// DESIGN INVARIANTS:
//   1. Local object store keys are BLAKE3 with the "cas:" domain prefix. The
//      prefix is part of the on-disk contract; changing it orphans every
//      stored object.
//   2. Network identifiers are SHA-256, because that is what the network
//      signs and addresses by. Never mix the two schemes for one purpose.

#include <array>
#include <memory>
#include <stdexcept>

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include "permagate/encoding.hpp"

extern "C" {
#include <blake3.h>
}

namespace permagate {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

}  // namespace

std::string blake3_hex(std::string_view payload) {
  Blake3Hasher hasher;
  hasher.update(payload.data(), payload.size());
  return hasher.finalize_hex();
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  Blake3Hasher hasher(domain);
  hasher.update(payload.data(), payload.size());
  return hasher.finalize_hex();
}

std::string cas_content_hash(std::string_view raw_bytes) {
  return hash_domain("cas:", raw_bytes);
}

struct Blake3Hasher::Impl {
  blake3_hasher state;
};

Blake3Hasher::Blake3Hasher(std::string_view domain) : impl_(std::make_unique<Impl>()) {
  blake3_hasher_init(&impl_->state);
  if (!domain.empty()) blake3_hasher_update(&impl_->state, domain.data(), domain.size());
}

Blake3Hasher::~Blake3Hasher() = default;

void Blake3Hasher::update(const char* data, std::size_t len) {
  if (len > 0) blake3_hasher_update(&impl_->state, data, len);
}

std::string Blake3Hasher::finalize_hex() const {
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&impl_->state, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

// ---------------------------------------------------------------------------
// SHA-256
// ---------------------------------------------------------------------------

struct Sha256Hasher::Impl {
  EVP_MD_CTX* ctx{nullptr};

  Impl() = default;
  Impl(const Impl&) = delete;
  Impl& operator=(const Impl&) = delete;
  ~Impl() { EVP_MD_CTX_free(ctx); }
};

Sha256Hasher::Sha256Hasher() : impl_(std::make_unique<Impl>()) {
  impl_->ctx = EVP_MD_CTX_new();
  if (!impl_->ctx || EVP_DigestInit_ex(impl_->ctx, EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex(sha256) failed");
  }
}

Sha256Hasher::~Sha256Hasher() = default;

void Sha256Hasher::update(const char* data, std::size_t len) {
  if (len > 0 && EVP_DigestUpdate(impl_->ctx, data, len) != 1) {
    throw std::runtime_error("EVP_DigestUpdate(sha256) failed");
  }
}

std::string Sha256Hasher::finalize() {
  std::array<unsigned char, EVP_MAX_MD_SIZE> out{};
  unsigned int size = 0;
  if (EVP_DigestFinal_ex(impl_->ctx, out.data(), &size) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex(sha256) failed");
  }
  return std::string(reinterpret_cast<char*>(out.data()), size);
}

std::string sha256_bytes(std::string_view payload) {
  Sha256Hasher hasher;
  hasher.update(payload.data(), payload.size());
  return hasher.finalize();
}

std::string sha256_b64url(std::string_view payload) {
  return to_b64url(sha256_bytes(payload));
}

HashRuntimeInfo hash_runtime_info() {
  HashRuntimeInfo info;
  info.blake3_version = blake3_version();
  info.openssl_version = OpenSSL_version(OPENSSL_VERSION);
  return info;
}

}  // namespace permagate
