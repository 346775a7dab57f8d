#include "ingredients/completion_client.hpp"

#include "ingredients/error.hpp"
#include "ingredients/utils/values.hpp"
#include "ingredients/version.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <map>
#include <set>
#include <utility>

namespace ingredients {
namespace {

using json = nlohmann::json;

constexpr const char* kPromptPrefix = "Classify the ingredient '";
constexpr const char* kPromptSuffix = "' as vegan, vegetarian, or regular. Respond in JSON format.";

std::string extract_error_message(const json& payload) {
  if (payload.contains("error")) {
    const auto& err = payload.at("error");
    if (err.is_object() && err.contains("message") && err.at("message").is_string()) {
      return err.at("message").get<std::string>();
    }
    if (err.is_string()) {
      return err.get<std::string>();
    }
  }
  return {};
}

json extract_error_payload(const json& payload) {
  if (payload.contains("error")) {
    const auto& err = payload.at("error");
    if (err.is_object()) {
      return err;
    }
  }
  return payload;
}

std::map<std::string, std::string> sanitize_headers(const std::map<std::string, std::string>& headers) {
  static const std::set<std::string> kSensitive = {"authorization", "cookie", "set-cookie"};
  std::map<std::string, std::string> sanitized;
  for (const auto& [key, value] : headers) {
    std::string lowered; lowered.reserve(key.size());
    std::transform(key.begin(), key.end(), std::back_inserter(lowered), [](unsigned char c) {
      return static_cast<char>(std::tolower(c));
    });
    if (kSensitive.count(lowered)) {
      sanitized[key] = "***";
    } else {
      sanitized[key] = value;
    }
  }
  return sanitized;
}

json build_request_log_details(const HttpRequest& request) {
  json details;
  details["method"] = request.method;
  details["url"] = request.url;
  details["timeout_ms"] = request.timeout.count();
  details["headers"] = sanitize_headers(request.headers);
  return details;
}

json build_response_log_details(const HttpRequest& request,
                                const HttpResponse& response,
                                std::chrono::steady_clock::duration duration) {
  json details = build_request_log_details(request);
  details["status"] = response.status_code;
  details["duration_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
  details["response_headers"] = sanitize_headers(response.headers);
  return details;
}

bool is_success_status(long status) {
  return status >= 200 && status < 300;
}

}  // namespace

std::string build_prompt(const std::string& ingredient) {
  return kPromptPrefix + ingredient + kPromptSuffix;
}

CompletionClient::CompletionClient(ClientOptions options,
                                   std::unique_ptr<HttpClient> http_client)
    : options_(std::move(options)),
      http_client_(http_client ? std::move(http_client) : make_default_http_client()),
      logger_(options_.log_level, options_.logger) {
  if (options_.api_key.empty()) {
    throw ConfigurationError("Missing API key. Provide ClientOptions.api_key or set the OPENAI_API_KEY environment variable.");
  }
  if (options_.model.empty()) {
    throw ConfigurationError("ClientOptions.model must not be empty");
  }
  if (!utils::is_absolute_url(options_.endpoint)) {
    throw ConfigurationError("ClientOptions.endpoint must be an absolute URL: " + options_.endpoint);
  }
  utils::validate_positive_integer("ClientOptions.timeout", options_.timeout.count());
}

CompletionRequest CompletionClient::build_request(const std::string& ingredient) const {
  CompletionRequest request;
  request.model = options_.model;
  request.messages.push_back(CompletionMessage{"user", build_prompt(ingredient)});
  request.response_format.type = "json_object";
  return request;
}

HttpRequest CompletionClient::build_http_request(const CompletionRequest& request) const {
  HttpRequest http_request;
  http_request.method = "POST";
  http_request.url = options_.endpoint;
  http_request.body = completion_request_to_json(request).dump();
  http_request.timeout = options_.timeout;
  http_request.headers["Authorization"] = std::string("Bearer ") + options_.api_key;
  http_request.headers["Content-Type"] = "application/json";
  http_request.headers["Accept"] = "application/json";
  http_request.headers["User-Agent"] = kUserAgent;
  return http_request;
}

std::string CompletionClient::complete(const std::string& ingredient) const {
  HttpRequest http_request = build_http_request(build_request(ingredient));
  logger_.log(LogLevel::Debug, "sending request", build_request_log_details(http_request));

  auto start_time = std::chrono::steady_clock::now();
  HttpResponse response;
  try {
    response = http_client_->request(http_request);
  } catch (const UpstreamTransportError& error) {
    auto details = build_request_log_details(http_request);
    details["error"] = error.what();
    logger_.log(LogLevel::Error, "request failed", details);
    throw;
  } catch (const IngredientsError&) {
    throw;
  } catch (const std::exception& error) {
    auto details = build_request_log_details(http_request);
    details["error"] = error.what();
    logger_.log(LogLevel::Error, "request failed", details);
    throw UpstreamTransportError(error.what());
  }
  auto duration = std::chrono::steady_clock::now() - start_time;

  if (!is_success_status(response.status_code)) {
    json error_payload = json::object();
    std::string message;
    if (auto payload = utils::safe_json(response.body)) {
      message = extract_error_message(*payload);
      error_payload = extract_error_payload(*payload);
    }
    logger_.log(LogLevel::Error, "request failed", build_response_log_details(http_request, response, duration));
    if (message.empty()) {
      message = "HTTP " + std::to_string(response.status_code) + " error";
    }
    throw UpstreamStatusError(message, response.status_code, std::move(error_payload));
  }
  logger_.log(LogLevel::Info, "request succeeded", build_response_log_details(http_request, response, duration));

  CompletionResponse completion;
  try {
    completion = parse_completion_response(json::parse(response.body));
  } catch (const json::exception& ex) {
    logger_.log(LogLevel::Error, "failed to parse completion response",
                {{"error", ex.what()}, {"body", response.body}});
    throw UpstreamParseError(std::string("Failed to parse completion response: ") + ex.what(), response.body);
  } catch (const UpstreamParseError& ex) {
    logger_.log(LogLevel::Error, "failed to parse completion response",
                {{"error", ex.what()}, {"body", response.body}});
    throw UpstreamParseError(ex.what(), response.body);
  }

  if (completion.choices.empty()) {
    logger_.log(LogLevel::Error, "completion response has no choices", {{"body", response.body}});
    throw EmptyChoicesError("Completion response contained no choices", response.body);
  }
  const auto& first = completion.choices.front();
  logger_.log(LogLevel::Debug, "completion received",
              {{"id", completion.id},
               {"model", completion.model},
               {"choices", completion.choices.size()},
               {"finish_reason", first.finish_reason ? json(*first.finish_reason) : json(nullptr)}});
  return first.message.content;
}

}  // namespace ingredients
