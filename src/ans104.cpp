#include "permagate/ans104.hpp"

#include <algorithm>
#include <limits>

#include "permagate/encoding.hpp"
#include "permagate/hash.hpp"

namespace permagate {
namespace ans104 {

namespace {

constexpr uint64_t kHeaderEntrySize = 64;
constexpr size_t kMaxTagBytes = 4096 * 1024;

const SignatureLayout kLayouts[] = {
    {1, 512, 512, "arweave"},
    {2, 64, 32, "ed25519"},
    {3, 65, 65, "ethereum"},
    {4, 64, 32, "solana"},
    {5, 64, 32, "injectedaptos"},
    {6, 2052, 1025, "multiaptos"},
    {7, 65, 42, "typedethereum"},
};

[[noreturn]] void fail(ErrorCode code, const std::string& message) {
  throw GatewayError(code, message);
}

// Tracks how far into the bundle the parser has read.
class BundleReader {
 public:
  BundleReader(std::istream& in, uint64_t size) : in_(in), size_(size) {}

  std::string read(uint64_t n, const char* what) {
    require(n, what);
    std::string out(static_cast<size_t>(n), '\0');
    in_.read(out.data(), static_cast<std::streamsize>(n));
    if (static_cast<uint64_t>(in_.gcount()) != n) {
      fail(ErrorCode::bundle_truncated,
           std::string("stream ended while reading ") + what + " at byte " +
               std::to_string(pos_ + static_cast<uint64_t>(in_.gcount())));
    }
    pos_ += n;
    return out;
  }

  uint64_t read_le_field(size_t width, const char* what) {
    const std::string bytes = read(width, what);
    auto v = read_le(bytes);
    if (!v) fail(ErrorCode::bundle_parse_error, std::string(what) + " does not fit 64 bits");
    return *v;
  }

  void skip(uint64_t n, const char* what) {
    require(n, what);
    constexpr uint64_t kStep = uint64_t{1} << 30;
    uint64_t left = n;
    while (left > 0) {
      const uint64_t step = std::min(left, kStep);
      in_.ignore(static_cast<std::streamsize>(step));
      if (static_cast<uint64_t>(in_.gcount()) != step) {
        fail(ErrorCode::bundle_truncated,
             std::string("stream ended while skipping ") + what);
      }
      left -= step;
    }
    pos_ += n;
  }

  uint64_t position() const { return pos_; }

 private:
  void require(uint64_t n, const char* what) {
    if (n > size_ - pos_) {
      fail(ErrorCode::bundle_parse_error,
           std::string(what) + " extends past the declared bundle size");
    }
  }

  std::istream& in_;
  uint64_t size_;
  uint64_t pos_{0};
};

// Avro "long": zigzag-encoded varint.
int64_t read_avro_long(const std::string& buf, size_t& pos) {
  uint64_t value = 0;
  int shift = 0;
  while (true) {
    if (pos >= buf.size()) fail(ErrorCode::bundle_parse_error, "tag varint runs past tag bytes");
    const auto b = static_cast<uint8_t>(buf[pos++]);
    value |= static_cast<uint64_t>(b & 0x7f) << shift;
    if ((b & 0x80) == 0) break;
    shift += 7;
    if (shift > 63) fail(ErrorCode::bundle_parse_error, "tag varint too long");
  }
  return static_cast<int64_t>(value >> 1) ^ -static_cast<int64_t>(value & 1);
}

void write_avro_long(std::string& out, int64_t v) {
  uint64_t z = (static_cast<uint64_t>(v) << 1) ^ static_cast<uint64_t>(v >> 63);
  while (z >= 0x80) {
    out.push_back(static_cast<char>((z & 0x7f) | 0x80));
    z >>= 7;
  }
  out.push_back(static_cast<char>(z));
}

std::string read_avro_bytes(const std::string& buf, size_t& pos) {
  const int64_t len = read_avro_long(buf, pos);
  if (len < 0 || static_cast<uint64_t>(len) > buf.size() - pos) {
    fail(ErrorCode::bundle_parse_error, "tag string length out of range");
  }
  std::string out = buf.substr(pos, static_cast<size_t>(len));
  pos += static_cast<size_t>(len);
  return out;
}

std::string optional_id(BundleReader& r, const char* flag_name, const char* field_name) {
  const std::string flag = r.read(1, flag_name);
  if (flag[0] == 0) return {};
  if (flag[0] != 1) fail(ErrorCode::bundle_parse_error, std::string(flag_name) + " is not 0 or 1");
  return to_b64url(r.read(32, field_name));
}

}  // namespace

std::optional<SignatureLayout> signature_layout(uint16_t signature_type) {
  for (const auto& l : kLayouts) {
    if (l.type == signature_type) return l;
  }
  return std::nullopt;
}

std::string encode_tags(const Tags& tags) {
  std::string out;
  if (tags.empty()) return out;
  write_avro_long(out, static_cast<int64_t>(tags.size()));
  for (const auto& [name, value] : tags) {
    write_avro_long(out, static_cast<int64_t>(name.size()));
    out += name;
    write_avro_long(out, static_cast<int64_t>(value.size()));
    out += value;
  }
  write_avro_long(out, 0);
  return out;
}

Tags decode_tags(const std::string& bytes) {
  Tags tags;
  if (bytes.empty()) return tags;

  size_t pos = 0;
  while (true) {
    int64_t count = read_avro_long(bytes, pos);
    if (count == 0) break;
    if (count == std::numeric_limits<int64_t>::min()) {
      fail(ErrorCode::bundle_parse_error, "tag block count out of range");
    }
    if (count < 0) {
      count = -count;
      read_avro_long(bytes, pos);  // block byte size
    }
    if (static_cast<uint64_t>(count) > bytes.size()) {
      fail(ErrorCode::bundle_parse_error, "tag block count out of range");
    }
    for (int64_t i = 0; i < count; ++i) {
      std::string name = read_avro_bytes(bytes, pos);
      std::string value = read_avro_bytes(bytes, pos);
      tags.emplace_back(std::move(name), std::move(value));
    }
  }
  if (pos != bytes.size()) fail(ErrorCode::bundle_parse_error, "trailing bytes after tags");
  return tags;
}

std::vector<DataItem> parse_bundle(std::istream& in, uint64_t bundle_size,
                                   const std::string& parent_id,
                                   const std::string& root_tx_id) {
  BundleReader r(in, bundle_size);

  const uint64_t count = r.read_le_field(32, "item count");
  if (count > (bundle_size - 32) / kHeaderEntrySize) {
    fail(ErrorCode::bundle_parse_error,
         "item count " + std::to_string(count) + " does not fit the bundle");
  }

  struct HeaderEntry {
    uint64_t size;
    std::string id;  // raw 32 bytes
  };
  std::vector<HeaderEntry> entries;
  entries.reserve(static_cast<size_t>(count));
  for (uint64_t i = 0; i < count; ++i) {
    HeaderEntry e;
    e.size = r.read_le_field(32, "item size");
    e.id = r.read(32, "item id");
    entries.push_back(std::move(e));
  }

  std::vector<DataItem> items;
  items.reserve(entries.size());
  for (uint64_t index = 0; index < entries.size(); ++index) {
    const HeaderEntry& entry = entries[index];
    const uint64_t start = r.position();
    if (entry.size > bundle_size - start) {
      fail(ErrorCode::bundle_parse_error,
           "item " + std::to_string(index) + " extends past the declared bundle size");
    }

    DataItem item;
    item.index = index;
    item.parent_id = parent_id;
    item.root_tx_id = root_tx_id;
    item.offset = start;
    item.size = entry.size;

    const std::string sig_type = r.read(2, "signature type");
    item.signature_type = static_cast<uint16_t>(
        static_cast<uint8_t>(sig_type[0]) | (static_cast<uint8_t>(sig_type[1]) << 8));
    const auto layout = signature_layout(item.signature_type);
    if (!layout) {
      fail(ErrorCode::bundle_parse_error,
           "item " + std::to_string(index) + " has unknown signature type " +
               std::to_string(item.signature_type));
    }

    const std::string signature = r.read(layout->signature_length, "signature");
    const std::string owner = r.read(layout->owner_length, "owner");
    if (sha256_bytes(signature) != entry.id) {
      fail(ErrorCode::checksum_mismatch,
           "item " + std::to_string(index) + " id does not match its signature");
    }
    item.id = to_b64url(entry.id);
    item.owner_address = sha256_b64url(owner);
    item.target = optional_id(r, "target flag", "target");
    item.anchor = optional_id(r, "anchor flag", "anchor");

    const uint64_t tag_count = r.read_le_field(8, "tag count");
    const uint64_t tag_bytes_len = r.read_le_field(8, "tag bytes length");
    if (tag_bytes_len > kMaxTagBytes) {
      fail(ErrorCode::bundle_parse_error, "tag bytes length out of range");
    }
    item.tags = decode_tags(r.read(tag_bytes_len, "tags"));
    if (item.tags.size() != tag_count) {
      fail(ErrorCode::bundle_parse_error,
           "item " + std::to_string(index) + " declares " + std::to_string(tag_count) +
               " tags but encodes " + std::to_string(item.tags.size()));
    }

    const uint64_t header_len = r.position() - start;
    if (header_len > entry.size) {
      fail(ErrorCode::bundle_parse_error,
           "item " + std::to_string(index) + " header is larger than its declared size");
    }
    item.data_offset = r.position();
    item.data_size = entry.size - header_len;
    r.skip(item.data_size, "item data");

    items.push_back(std::move(item));
  }
  return items;
}

}  // namespace ans104
}  // namespace permagate
