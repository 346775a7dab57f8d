#include "ingredients/utils/values.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace ingredients::utils {

bool is_absolute_url(std::string_view url) {
  auto colon_pos = url.find(':');
  if (colon_pos == std::string_view::npos) {
    return false;
  }
  if (colon_pos == 0) {
    return false;
  }

  unsigned char first = static_cast<unsigned char>(url[0]);
  if (!std::isalpha(first)) {
    return false;
  }

  for (std::size_t i = 1; i < colon_pos; ++i) {
    unsigned char ch = static_cast<unsigned char>(url[i]);
    if (!(std::isalnum(ch) || ch == '+' || ch == '.' || ch == '-')) {
      return false;
    }
  }

  return true;
}

std::optional<long long> parse_integer(const std::string& text) {
  if (text.empty()) {
    return std::nullopt;
  }
  errno = 0;
  char* end = nullptr;
  long long parsed = std::strtoll(text.c_str(), &end, 10);
  if (errno == ERANGE || end == text.c_str() || *end != '\0') {
    return std::nullopt;
  }
  return parsed;
}

std::optional<nlohmann::json> safe_json(const std::string& text) {
  if (text.empty()) {
    return std::nullopt;
  }
  try {
    return nlohmann::json::parse(text);
  } catch (const nlohmann::json::exception&) {
    return std::nullopt;
  }
}

}  // namespace ingredients::utils
