#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace ingredients {

struct CompletionMessage {
  std::string role;
  std::string content;
};

struct CompletionResponseFormat {
  std::string type = "json_object";
};

struct CompletionRequest {
  std::string model;
  std::vector<CompletionMessage> messages;
  CompletionResponseFormat response_format;
};

struct CompletionChoice {
  CompletionMessage message;
  std::optional<std::string> finish_reason;
};

struct CompletionResponse {
  std::string id;
  std::string model;
  std::vector<CompletionChoice> choices;
};

nlohmann::json completion_request_to_json(const CompletionRequest& request);

/**
 * Reads the chat completion envelope. Throws UpstreamParseError when `choices`
 * is missing or a choice lacks a string `message.content`. An empty `choices`
 * array is returned as-is; rejecting it is up to the caller.
 */
CompletionResponse parse_completion_response(const nlohmann::json& payload);

}  // namespace ingredients
