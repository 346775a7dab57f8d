#include "ingredients/http_client.hpp"

#include "ingredients/error.hpp"
#include "ingredients/version.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <memory>
#include <string>

namespace ingredients {
namespace {

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* body = static_cast<std::string*>(userdata);
  const size_t total = size * nmemb;
  body->append(ptr, total);
  return total;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
  std::size_t total_size = size * nitems;
  std::string line(buffer, total_size);

  auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
  auto colon_pos = line.find(':');
  if (colon_pos != std::string::npos) {
    std::string key = line.substr(0, colon_pos);
    std::string value = line.substr(colon_pos + 1);

    auto trim = [](std::string& s) {
      auto not_space = [](unsigned char ch) { return !std::isspace(static_cast<unsigned char>(ch)); };
      s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
      s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    };

    trim(key);
    trim(value);
    if (!key.empty()) {
      (*headers)[key] = value;
    }
  }

  return total_size;
}

struct CurlHandleDeleter {
  void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct CurlListDeleter {
  void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

class CurlHttpClient : public HttpClient {
public:
  CurlHttpClient() = default;

  HttpResponse request(const HttpRequest& request) override {
    std::unique_ptr<CURL, CurlHandleDeleter> curl(curl_easy_init());
    if (!curl) {
      throw UpstreamTransportError("Failed to initialize libcurl");
    }

    curl_slist* header_list = nullptr;
    for (const auto& [key, value] : request.headers) {
      std::string header = key + ": " + value;
      header_list = curl_slist_append(header_list, header.c_str());
    }
    std::unique_ptr<curl_slist, CurlListDeleter> headers_guard(header_list);

    std::string response_body;
    std::map<std::string, std::string> response_headers;

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response_headers);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, kUserAgent);

    if (!request.body.empty()) {
      curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
      curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    }

    CURLcode res = curl_easy_perform(curl.get());

    if (res == CURLE_OPERATION_TIMEDOUT) {
      throw UpstreamTimeoutError(std::string("libcurl error: ") + curl_easy_strerror(res));
    }
    if (res != CURLE_OK) {
      throw UpstreamTransportError(std::string("libcurl error: ") + curl_easy_strerror(res));
    }

    long status_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status_code);

    return HttpResponse{status_code, std::move(response_headers), std::move(response_body)};
  }
};

struct CurlGlobalState {
  CurlGlobalState() { curl_global_init(CURL_GLOBAL_DEFAULT); }
  ~CurlGlobalState() { curl_global_cleanup(); }
};

CurlGlobalState& curl_state() {
  static CurlGlobalState state;
  return state;
}

}  // namespace

std::unique_ptr<HttpClient> make_default_http_client() {
  (void)curl_state();
  return std::make_unique<CurlHttpClient>();
}

}  // namespace ingredients
