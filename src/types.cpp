#include "permagate/types.hpp"

namespace permagate {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::not_found: return "not_found";
    case ErrorCode::http_error: return "http_error";
    case ErrorCode::upstream_unavailable: return "upstream_unavailable";
    case ErrorCode::io_error: return "io_error";
    case ErrorCode::bundle_parse_error: return "bundle_parse_error";
    case ErrorCode::bundle_truncated: return "bundle_truncated";
    case ErrorCode::checksum_mismatch: return "checksum_mismatch";
    case ErrorCode::filter_invalid: return "filter_invalid";
    case ErrorCode::config_invalid: return "config_invalid";
    case ErrorCode::no_data_source: return "no_data_source";
  }
  return "";
}

}  // namespace permagate
