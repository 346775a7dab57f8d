#include "ingredients/classification_service.hpp"

#include "ingredients/error.hpp"
#include "ingredients/utils/values.hpp"

#include <nlohmann/json.hpp>

namespace ingredients {

std::string ClassificationService::categorize(const std::string& ingredient) const {
  std::string content = client_.complete(ingredient);

  auto parsed = utils::safe_json(content);
  if (!parsed) {
    logger_.log(LogLevel::Error, "completion content is not valid JSON", {{"content", content}});
    throw ClassificationParseError("Completion content is not valid JSON", content);
  }
  if (!parsed->is_object() || !parsed->contains("classification") ||
      !parsed->at("classification").is_string()) {
    logger_.log(LogLevel::Error, "completion content has no classification", {{"content", content}});
    throw ClassificationParseError("Completion content has no string 'classification' field", content);
  }

  auto classification = parsed->at("classification").get<std::string>();
  logger_.log(LogLevel::Debug, "ingredient classified",
              {{"ingredient", ingredient}, {"classification", classification}});
  return classification;
}

}  // namespace ingredients
