#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <string>

namespace ingredients {

struct HttpRequest {
  std::string method;
  std::string url;
  std::map<std::string, std::string> headers;
  std::string body;
  std::chrono::milliseconds timeout{5000};
};

struct HttpResponse {
  long status_code = 0;
  std::map<std::string, std::string> headers;
  std::string body;
};

class HttpClient {
public:
  virtual ~HttpClient() = default;
  virtual HttpResponse request(const HttpRequest& request) = 0;
};

/**
 * Returns the libcurl-backed client. Every request uses its own easy handle,
 * so a single instance may be shared between threads.
 */
std::unique_ptr<HttpClient> make_default_http_client();

}  // namespace ingredients
