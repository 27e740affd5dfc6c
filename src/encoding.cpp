#include "permagate/encoding.hpp"

#include <array>

#include <msgpack/pack.hpp>
#include <msgpack/sbuffer.hpp>
#include <msgpack/unpack.hpp>

namespace permagate {
namespace {

constexpr char kB64UrlChars[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

constexpr std::array<int8_t, 256> make_b64_table() {
  std::array<int8_t, 256> t{};
  for (auto& v : t) v = -1;
  for (int i = 0; i < 64; ++i) {
    t[static_cast<unsigned char>(kB64UrlChars[i])] = static_cast<int8_t>(i);
  }
  t[static_cast<unsigned char>('+')] = 62;
  t[static_cast<unsigned char>('/')] = 63;
  return t;
}

constexpr auto kB64Table = make_b64_table();

void pack_key(msgpack::packer<msgpack::sbuffer>& packer, std::string_view key) {
  packer.pack_str(static_cast<uint32_t>(key.size()));
  packer.pack_str_body(key.data(), static_cast<uint32_t>(key.size()));
}

void pack_bytes(msgpack::packer<msgpack::sbuffer>& packer, std::string_view bytes) {
  packer.pack_bin(static_cast<uint32_t>(bytes.size()));
  packer.pack_bin_body(bytes.data(), static_cast<uint32_t>(bytes.size()));
}

// bin or str; both carry raw bytes here.
std::optional<std::string> bytes_of(const msgpack::object& o) {
  if (o.type == msgpack::type::BIN) return std::string(o.via.bin.ptr, o.via.bin.size);
  if (o.type == msgpack::type::STR) return std::string(o.via.str.ptr, o.via.str.size);
  return std::nullopt;
}

std::optional<ChunkMetadata> metadata_from_object(const msgpack::object& root) {
  if (root.type != msgpack::type::MAP) return std::nullopt;

  ChunkMetadata md;
  bool has_root = false, has_size = false, has_offset = false, has_path = false;
  for (uint32_t i = 0; i < root.via.map.size; ++i) {
    const msgpack::object_kv& kv = root.via.map.ptr[i];
    if (kv.key.type != msgpack::type::STR) return std::nullopt;
    const std::string_view key(kv.key.via.str.ptr, kv.key.via.str.size);
    if (key == "data_root" || key == "data_path") {
      auto v = bytes_of(kv.val);
      if (!v) return std::nullopt;
      if (key == "data_root") { md.data_root = std::move(*v); has_root = true; }
      else { md.data_path = std::move(*v); has_path = true; }
    } else if (key == "data_size" || key == "offset") {
      if (kv.val.type != msgpack::type::POSITIVE_INTEGER) return std::nullopt;
      if (key == "data_size") { md.data_size = kv.val.via.u64; has_size = true; }
      else { md.offset = kv.val.via.u64; has_offset = true; }
    }
    // Fields written by newer versions are skipped.
  }
  if (!has_root || !has_size || !has_offset || !has_path) return std::nullopt;
  return md;
}

}  // namespace

std::string to_b64url(std::string_view bytes) {
  std::string out;
  out.reserve((bytes.size() * 4 + 2) / 3);
  std::size_t i = 0;
  while (i + 3 <= bytes.size()) {
    const uint32_t n = (static_cast<uint8_t>(bytes[i]) << 16) |
                       (static_cast<uint8_t>(bytes[i + 1]) << 8) |
                       static_cast<uint8_t>(bytes[i + 2]);
    out += kB64UrlChars[(n >> 18) & 63];
    out += kB64UrlChars[(n >> 12) & 63];
    out += kB64UrlChars[(n >> 6) & 63];
    out += kB64UrlChars[n & 63];
    i += 3;
  }
  const std::size_t rest = bytes.size() - i;
  if (rest == 1) {
    const uint32_t n = static_cast<uint8_t>(bytes[i]) << 16;
    out += kB64UrlChars[(n >> 18) & 63];
    out += kB64UrlChars[(n >> 12) & 63];
  } else if (rest == 2) {
    const uint32_t n = (static_cast<uint8_t>(bytes[i]) << 16) |
                       (static_cast<uint8_t>(bytes[i + 1]) << 8);
    out += kB64UrlChars[(n >> 18) & 63];
    out += kB64UrlChars[(n >> 12) & 63];
    out += kB64UrlChars[(n >> 6) & 63];
  }
  return out;
}

std::optional<std::string> from_b64url(std::string_view text) {
  while (!text.empty() && text.back() == '=') text.remove_suffix(1);
  if (text.size() % 4 == 1) return std::nullopt;

  std::string out;
  out.reserve(text.size() * 3 / 4);
  uint32_t acc = 0;
  int bits = 0;
  for (char c : text) {
    const int8_t v = kB64Table[static_cast<unsigned char>(c)];
    if (v < 0) return std::nullopt;
    acc = (acc << 6) | static_cast<uint32_t>(v);
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      out.push_back(static_cast<char>((acc >> bits) & 0xff));
    }
  }
  return out;
}

std::optional<uint64_t> read_le(std::string_view bytes) {
  uint64_t v = 0;
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    const auto b = static_cast<uint8_t>(bytes[i]);
    if (i >= 8) {
      if (b != 0) return std::nullopt;
      continue;
    }
    v |= static_cast<uint64_t>(b) << (8 * i);
  }
  return v;
}

std::string write_le(uint64_t value, std::size_t width) {
  std::string out(width, '\0');
  for (std::size_t i = 0; i < width && i < 8; ++i) {
    out[i] = static_cast<char>((value >> (8 * i)) & 0xff);
  }
  return out;
}

std::string chunk_metadata_to_msgpack(const ChunkMetadata& metadata) {
  msgpack::sbuffer buffer;
  msgpack::packer<msgpack::sbuffer> packer(buffer);
  packer.pack_map(4);
  pack_key(packer, "data_root");
  pack_bytes(packer, metadata.data_root);
  pack_key(packer, "data_size");
  packer.pack_uint64(metadata.data_size);
  pack_key(packer, "offset");
  packer.pack_uint64(metadata.offset);
  pack_key(packer, "data_path");
  pack_bytes(packer, metadata.data_path);
  return std::string(buffer.data(), buffer.size());
}

std::optional<ChunkMetadata> chunk_metadata_from_msgpack(std::string_view bytes) {
  try {
    const msgpack::object_handle handle = msgpack::unpack(bytes.data(), bytes.size());
    return metadata_from_object(handle.get());
  } catch (const msgpack::unpack_error&) {
    return std::nullopt;
  }
}

}  // namespace permagate
