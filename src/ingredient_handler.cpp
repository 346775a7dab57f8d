#include "ingredients/ingredient_handler.hpp"

#include "ingredients/error.hpp"
#include "ingredients/utils/values.hpp"

#include <nlohmann/json.hpp>

namespace ingredients {
namespace {

using json = nlohmann::json;

HandlerResponse error_response(int status, const std::string& message) {
  return HandlerResponse{status, json{{"error", message}}.dump()};
}

}  // namespace

ClassificationRequest parse_classification_request(const std::string& body) {
  auto payload = utils::safe_json(body);
  if (!payload) {
    throw InvalidRequestError("Request body must be a JSON object");
  }
  if (!payload->is_object()) {
    throw InvalidRequestError("Request body must be a JSON object");
  }
  if (!payload->contains("ingredient") || !payload->at("ingredient").is_string()) {
    throw InvalidRequestError("Request body must contain a string 'ingredient'");
  }
  ClassificationRequest request;
  request.ingredient = payload->at("ingredient").get<std::string>();
  if (request.ingredient.empty()) {
    throw InvalidRequestError("'ingredient' must not be empty");
  }
  return request;
}

HandlerResponse IngredientHandler::handle(const std::string& body) const {
  ClassificationRequest request;
  try {
    request = parse_classification_request(body);
  } catch (const InvalidRequestError& error) {
    logger_.log(LogLevel::Warn, "rejected classification request", {{"error", error.what()}});
    return error_response(400, error.what());
  }

  try {
    std::string classification = service_.categorize(request.ingredient);
    nlohmann::ordered_json result;
    result["ingredient"] = request.ingredient;
    result["classification"] = classification;
    return HandlerResponse{200, result.dump(-1, ' ', false, json::error_handler_t::replace)};
  } catch (const UpstreamTimeoutError& error) {
    logger_.log(LogLevel::Error, "classification timed out",
                {{"ingredient", request.ingredient}, {"error", error.what()}});
    return error_response(504, "upstream request timed out");
  } catch (const UpstreamStatusError& error) {
    logger_.log(LogLevel::Error, "classification failed",
                {{"ingredient", request.ingredient},
                 {"error", error.what()},
                 {"upstream_status", error.status_code()},
                 {"upstream_error", error.error_body()}});
  } catch (const UpstreamParseError& error) {
    logger_.log(LogLevel::Error, "classification failed",
                {{"ingredient", request.ingredient}, {"error", error.what()}, {"body", error.raw_body()}});
  } catch (const ClassificationParseError& error) {
    logger_.log(LogLevel::Error, "classification failed",
                {{"ingredient", request.ingredient}, {"error", error.what()}, {"content", error.content()}});
  } catch (const std::exception& error) {
    logger_.log(LogLevel::Error, "classification failed",
                {{"ingredient", request.ingredient}, {"error", error.what()}});
  }
  return error_response(500, "classification failed");
}

}  // namespace ingredients
