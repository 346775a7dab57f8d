#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include <nlohmann/json.hpp>

#include "ingredients/error.hpp"

namespace ingredients::utils {

bool is_absolute_url(std::string_view url);

template <typename Integer,
          typename = std::enable_if_t<std::is_integral_v<Integer>>>
Integer validate_positive_integer(const std::string& name, Integer value) {
  if (value <= 0) {
    throw ConfigurationError(name + " must be a positive integer");
  }
  return value;
}

/// Parses a base-10 integer that spans the whole string.
std::optional<long long> parse_integer(const std::string& text);

std::optional<nlohmann::json> safe_json(const std::string& text);

}  // namespace ingredients::utils
