#pragma once

// permagate/http_client.hpp — Blocking HTTP GET over libcurl.
//
// DESIGN:
//   One easy handle per request; no handle pooling. Redirects are followed.
//   The configured timeout bounds the whole transfer and is the only
//   cancellation mechanism the pipeline has.
//
// ERRORS:
//   Transport failures (DNS, connect, timeout, TLS) throw
//   GatewayError(http_error). A completed exchange with any status code is
//   returned as-is; interpreting non-200 is the caller's job.
//
// get_to() streams the body into a caller-owned ostream as it arrives, so
// large objects never sit whole in memory; get() buffers it for small JSON
// and chunk responses. A sink that stops accepting bytes aborts the
// transfer with http_error.

#include <cstdint>
#include <ostream>
#include <string>

namespace permagate {

struct HttpResponse {
  long status{0};
  std::string body;
};

class IHttpClient {
 public:
  virtual ~IHttpClient() = default;

  // Writes the response body to `body` and returns the status code.
  virtual long get_to(const std::string& url, std::ostream& body) = 0;

  HttpResponse get(const std::string& url);
};

class CurlHttpClient : public IHttpClient {
 public:
  explicit CurlHttpClient(uint64_t timeout_ms = 15000);

  long get_to(const std::string& url, std::ostream& body) override;

  // Version string reported by libcurl, for `permagate health`.
  static std::string library_version();

 private:
  uint64_t timeout_ms_;
};

}  // namespace permagate
