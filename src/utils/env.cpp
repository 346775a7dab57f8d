#include "ingredients/utils/env.hpp"

#include "ingredients/error.hpp"
#include "ingredients/utils/values.hpp"

#include <cctype>
#include <cstdlib>
#include <string_view>

namespace ingredients::utils {
namespace {

std::string_view strip(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
    text.remove_suffix(1);
  }
  return text;
}

}  // namespace

std::optional<std::string> read_env(const std::string& name) {
  const char* raw = std::getenv(name.c_str());
  if (raw == nullptr) {
    return std::nullopt;
  }
  return std::string(strip(raw));
}

std::string read_env_or(const std::string& name, const std::string& fallback) {
  auto value = read_env(name);
  return value && !value->empty() ? *value : fallback;
}

long long read_env_integer(const std::string& name, long long fallback, long long max_value) {
  auto raw = read_env(name);
  if (!raw || raw->empty()) {
    return fallback;
  }
  auto parsed = parse_integer(*raw);
  if (!parsed) {
    throw ConfigurationError(name + " must be an integer, got '" + *raw + "'");
  }
  validate_positive_integer(name, *parsed);
  if (*parsed > max_value) {
    throw ConfigurationError(name + " must not exceed " + std::to_string(max_value));
  }
  return *parsed;
}

}  // namespace ingredients::utils
