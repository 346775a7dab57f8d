#include "ingredients/completion.hpp"

#include "ingredients/error.hpp"

#include <utility>

namespace ingredients {
namespace {

using json = nlohmann::json;

[[noreturn]] void throw_schema_error(const std::string& detail, const json& payload) {
  throw UpstreamParseError("Unexpected completion response: " + detail,
                           payload.dump(-1, ' ', false, json::error_handler_t::replace));
}

CompletionChoice parse_choice(const json& payload, const json& envelope) {
  if (!payload.is_object()) {
    throw_schema_error("choice is not an object", envelope);
  }
  CompletionChoice choice;
  if (!payload.contains("message") || !payload.at("message").is_object()) {
    throw_schema_error("choice has no message", envelope);
  }
  const auto& message = payload.at("message");
  if (!message.contains("content") || !message.at("content").is_string()) {
    throw_schema_error("message content is not a string", envelope);
  }
  choice.message.role = message.contains("role") && message.at("role").is_string()
                            ? message.at("role").get<std::string>()
                            : std::string();
  choice.message.content = message.at("content").get<std::string>();
  if (payload.contains("finish_reason") && payload.at("finish_reason").is_string()) {
    choice.finish_reason = payload.at("finish_reason").get<std::string>();
  }
  return choice;
}

}  // namespace

json completion_request_to_json(const CompletionRequest& request) {
  json body;
  body["model"] = request.model;

  json messages = json::array();
  for (const auto& message : request.messages) {
    messages.push_back({{"role", message.role}, {"content", message.content}});
  }
  body["messages"] = std::move(messages);

  body["response_format"] = {{"type", request.response_format.type}};
  return body;
}

CompletionResponse parse_completion_response(const json& payload) {
  if (!payload.is_object()) {
    throw_schema_error("body is not a JSON object", payload);
  }
  CompletionResponse response;
  if (payload.contains("id") && payload.at("id").is_string()) {
    response.id = payload.at("id").get<std::string>();
  }
  if (payload.contains("model") && payload.at("model").is_string()) {
    response.model = payload.at("model").get<std::string>();
  }

  if (!payload.contains("choices") || !payload.at("choices").is_array()) {
    throw_schema_error("missing choices array", payload);
  }
  for (const auto& choice_json : payload.at("choices")) {
    response.choices.push_back(parse_choice(choice_json, payload));
  }
  return response;
}

}  // namespace ingredients
