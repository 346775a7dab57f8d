#pragma once

#include <string>
#include <utility>

#include "ingredients/completion_client.hpp"
#include "ingredients/logging.hpp"

namespace ingredients {

class ClassificationService {
public:
  explicit ClassificationService(const CompletionClient& client, Logger logger = {})
      : client_(client), logger_(std::move(logger)) {}

  /**
   * Asks the completion provider to classify `ingredient` and returns the
   * `classification` member of the JSON object it answers with. The value is
   * passed through as-is; it is not checked against the expected categories.
   *
   * Throws ClassificationParseError when the content is not a JSON object with
   * a string `classification`. Errors from the completion client propagate.
   */
  std::string categorize(const std::string& ingredient) const;

private:
  const CompletionClient& client_;
  Logger logger_;
};

}  // namespace ingredients
