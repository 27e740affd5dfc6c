#include "permagate/http_client.hpp"

#include <memory>
#include <mutex>
#include <sstream>

#include <curl/curl.h>

#include "permagate/types.hpp"

namespace permagate {

namespace {

std::once_flag g_curl_init;

void ensure_curl_global_init() {
  std::call_once(g_curl_init, [] {
    const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (rc != CURLE_OK) {
      throw GatewayError(ErrorCode::http_error,
                         std::string("curl_global_init failed: ") + curl_easy_strerror(rc));
    }
  });
}

// Returning less than the chunk size makes curl abort with CURLE_WRITE_ERROR.
size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* body = static_cast<std::ostream*>(userdata);
  body->write(ptr, static_cast<std::streamsize>(size * nmemb));
  return *body ? size * nmemb : 0;
}

struct CurlDeleter {
  void operator()(CURL* h) const { curl_easy_cleanup(h); }
};

}  // namespace

CurlHttpClient::CurlHttpClient(uint64_t timeout_ms) : timeout_ms_(timeout_ms) {
  ensure_curl_global_init();
}

HttpResponse IHttpClient::get(const std::string& url) {
  std::ostringstream body;
  HttpResponse response;
  response.status = get_to(url, body);
  response.body = std::move(body).str();
  return response;
}

long CurlHttpClient::get_to(const std::string& url, std::ostream& body) {
  std::unique_ptr<CURL, CurlDeleter> handle(curl_easy_init());
  if (!handle) {
    throw GatewayError(ErrorCode::http_error, "curl_easy_init failed");
  }

  long status = 0;
  char errbuf[CURL_ERROR_SIZE] = {0};
  CURL* h = handle.get();
  curl_easy_setopt(h, CURLOPT_URL, url.c_str());
  curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(h, CURLOPT_MAXREDIRS, 5L);
  curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
  curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf);
  curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, &write_body);
  curl_easy_setopt(h, CURLOPT_WRITEDATA, static_cast<std::ostream*>(&body));
  curl_easy_setopt(h, CURLOPT_USERAGENT, "permagate/0.1");

  const CURLcode rc = curl_easy_perform(h);
  if (rc != CURLE_OK) {
    const std::string detail = errbuf[0] ? errbuf : curl_easy_strerror(rc);
    throw GatewayError(ErrorCode::http_error, "GET " + url + " failed: " + detail);
  }
  curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &status);
  return status;
}

std::string CurlHttpClient::library_version() {
  return curl_version();
}

}  // namespace permagate
