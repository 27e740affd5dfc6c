#pragma once

// permagate/ans104.hpp — ANS-104 bundle container parser.
//
// FORMAT (all integers little-endian):
//   bundle  := count:32  (size:32 id:32){count}  item{count}
//   item    := sig_type:2 signature owner
//              target_flag:1 [target:32] anchor_flag:1 [anchor:32]
//              tag_count:8 tag_bytes_len:8 tags:tag_bytes_len data
//   tags    := Avro array of {name: bytes, value: bytes}
//
// Signature and owner widths depend on sig_type (signature_layout()).
//
// INVARIANTS:
//   - The stream is read exactly once, front to back; item payloads are
//     skipped, not buffered.
//   - Either every item parses and verifies, or parse_bundle() throws and
//     returns nothing. Error codes: bundle_parse_error (malformed header or
//     item), bundle_truncated (stream ended before the declared bytes),
//     checksum_mismatch (header id != SHA-256(signature)).

#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <vector>

#include "permagate/types.hpp"

namespace permagate {
namespace ans104 {

struct SignatureLayout {
  uint16_t type;
  size_t signature_length;
  size_t owner_length;
  const char* name;
};

// nullopt for unknown signature types.
std::optional<SignatureLayout> signature_layout(uint16_t signature_type);

std::vector<DataItem> parse_bundle(std::istream& in, uint64_t bundle_size,
                                   const std::string& parent_id,
                                   const std::string& root_tx_id);

// Avro tag block codec. decode throws GatewayError(bundle_parse_error).
std::string encode_tags(const Tags& tags);
Tags decode_tags(const std::string& bytes);

}  // namespace ans104
}  // namespace permagate
