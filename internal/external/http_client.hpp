#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace sandbox::external {

struct HttpRequest {
  std::string               method = "GET";
  std::string               host   = "localhost";
  uint32_t                  port   = 80;
  std::string               path   = "/";
  std::string               body;
  std::string               content_type = "application/json";
  // Bounds connect and the whole exchange.
  std::chrono::milliseconds timeout{2000};
};

struct HttpResponse {
  int         status = 0;
  std::string body;
};

/*
  Blocking libcurl exchange for probes and local control calls.
  Follows redirects and decodes chunked bodies; throws std::runtime_error
  when no HTTP response arrives (resolve, connect, I/O or timeout).
*/
HttpResponse SendHttpRequest(const HttpRequest& request);

} // namespace sandbox::external
