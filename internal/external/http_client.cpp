#include "http_client.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>
#include <stdexcept>

namespace sandbox::external {

namespace {

struct CurlEasyDeleter {
  void operator()(CURL* handle) const {
    curl_easy_cleanup(handle);
  }
};

struct CurlListDeleter {
  void operator()(curl_slist* list) const {
    curl_slist_free_all(list);
  }
};

using CurlHandle  = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlHeaders = std::unique_ptr<curl_slist, CurlListDeleter>;

void EnsureGlobalInit() {
  static std::once_flag once;
  std::call_once(once, [] {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw std::runtime_error("curl_global_init failed");
    }
  });
}

size_t AppendBody(char* data, size_t size, size_t count, void* user) {
  static_cast<std::string*>(user)->append(data, size * count);
  return size * count;
}

std::string UrlFor(const HttpRequest& request) {
  std::string path = request.path.empty() ? "/" : request.path;
  if (path.front() != '/') path.insert(path.begin(), '/');
  return "http://" + request.host + ":" + std::to_string(request.port) + path;
}

} // namespace

HttpResponse SendHttpRequest(const HttpRequest& request) {
  EnsureGlobalInit();

  CurlHandle curl(curl_easy_init());
  if (!curl) throw std::runtime_error("curl_easy_init failed");

  const auto url        = UrlFor(request);
  const long timeout_ms = static_cast<long>(request.timeout.count());

  HttpResponse response;
  CurlHeaders  headers;

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 5L);
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeout_ms);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, AppendBody);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

  if (request.method == "GET") {
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
  } else {
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));

    const auto content_type = "Content-Type: " + request.content_type;
    headers.reset(curl_slist_append(nullptr, content_type.c_str()));
    if (!headers) throw std::runtime_error("curl_slist_append failed");
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  }

  const CURLcode rc = curl_easy_perform(curl.get());
  if (rc != CURLE_OK) {
    throw std::runtime_error(request.method + " " + url + ": " + curl_easy_strerror(rc));
  }

  long status = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
  response.status = static_cast<int>(status);
  return response;
}

} // namespace sandbox::external
