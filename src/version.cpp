#include "permagate/version.hpp"

#include <sstream>

namespace permagate {
namespace version {

VersionManifest current_manifest(const std::string& semver) {
  VersionManifest m;
  m.semver = semver.empty() ? "0.1.0" : semver;
  m.hash_primitive = "blake3";
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"chunk_cache_layout\":" << m.chunk_cache_layout
    << ",\"data_store_format\":" << m.data_store_format
    << ",\"hash_algorithm\":" << m.hash_algorithm
    << ",\"item_record\":" << m.item_record
    << ",\"semver\":\"" << m.semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

}  // namespace version
}  // namespace permagate
