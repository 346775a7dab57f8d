#pragma once

#include <string>
#include <utility>

#include "ingredients/classification_service.hpp"
#include "ingredients/logging.hpp"

namespace ingredients {

struct ClassificationRequest {
  std::string ingredient;
};

struct HandlerResponse {
  int status = 200;
  std::string body;
};

/// Parses `{"ingredient":"<name>"}`. Throws InvalidRequestError for anything else, including an empty name.
ClassificationRequest parse_classification_request(const std::string& body);

/**
 * Transport-independent handler for `POST /ingredients`.
 *
 * Success is 200 with `{"ingredient":...,"classification":...}`. Invalid input
 * is 400, an upstream timeout is 504 and every other failure is an opaque 500.
 * Error bodies are `{"error":"<message>"}` and never carry upstream content.
 */
class IngredientHandler {
public:
  explicit IngredientHandler(const ClassificationService& service, Logger logger = {})
      : service_(service), logger_(std::move(logger)) {}

  HandlerResponse handle(const std::string& body) const;

private:
  const ClassificationService& service_;
  Logger logger_;
};

}  // namespace ingredients
