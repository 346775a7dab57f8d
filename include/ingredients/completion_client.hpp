#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "ingredients/completion.hpp"
#include "ingredients/http_client.hpp"
#include "ingredients/logging.hpp"

namespace ingredients {

constexpr const char* kDefaultEndpoint = "https://api.openai.com/v1/chat/completions";
constexpr const char* kDefaultModel = "gpt-4o-mini";

struct ClientOptions {
  std::string api_key;
  std::string model = kDefaultModel;
  std::string endpoint = kDefaultEndpoint;
  std::chrono::milliseconds timeout{5000};
  LogLevel log_level = LogLevel::Off;
  LoggerCallback logger;
};

/// Literal substitution into the classification prompt. No escaping is applied.
std::string build_prompt(const std::string& ingredient);

class CompletionClient {
public:
  /// Throws ConfigurationError for an empty key or model, a relative endpoint or a non-positive timeout.
  explicit CompletionClient(ClientOptions options,
                            std::unique_ptr<HttpClient> http_client = nullptr);

  CompletionRequest build_request(const std::string& ingredient) const;

  /**
   * Sends one chat completion request for `ingredient` and returns
   * `choices[0].message.content`. Nothing is retried or cached.
   *
   * Throws UpstreamTimeoutError, UpstreamTransportError or UpstreamStatusError
   * when the call fails, UpstreamParseError when the body does not match the
   * expected envelope, and EmptyChoicesError when `choices` is empty.
   */
  std::string complete(const std::string& ingredient) const;

private:
  HttpRequest build_http_request(const CompletionRequest& request) const;

  ClientOptions options_;
  std::unique_ptr<HttpClient> http_client_;
  Logger logger_;
};

}  // namespace ingredients
