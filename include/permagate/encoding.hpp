#pragma once

// permagate/encoding.hpp — Byte encodings shared by the cache, the bundle
// parser and the HTTP clients.
//
//   - base64url without padding (RFC 4648 §5), the network's id encoding.
//   - Little-endian fixed-width integers, as ANS-104 lays them out.
//   - A MessagePack map for ChunkMetadata, packed with msgpack-cxx. Field
//     names are kept in the encoding (data_root, data_size, offset,
//     data_path) so files stay self-describing; byte fields use the bin
//     family, integers the uint family.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "permagate/types.hpp"

namespace permagate {

std::string to_b64url(std::string_view bytes);

// Accepts padded or unpadded input, and the standard alphabet's '+' '/'.
// Returns nullopt on characters outside either alphabet.
std::optional<std::string> from_b64url(std::string_view text);

// Reads `width` little-endian bytes. Returns nullopt when the value does not
// fit in 64 bits (ANS-104 uses 256-bit size fields).
std::optional<uint64_t> read_le(std::string_view bytes);

std::string write_le(uint64_t value, std::size_t width);

std::string chunk_metadata_to_msgpack(const ChunkMetadata& metadata);

// Returns nullopt on malformed input or missing fields.
std::optional<ChunkMetadata> chunk_metadata_from_msgpack(std::string_view bytes);

}  // namespace permagate
