#include "ingredients/config.hpp"

#include "ingredients/error.hpp"
#include "ingredients/utils/env.hpp"
#include "ingredients/utils/values.hpp"

#include <limits>
#include <string>

namespace ingredients {
namespace {

std::string endpoint_from_base_url(std::string base_url) {
  if (!utils::is_absolute_url(base_url)) {
    throw ConfigurationError("OPENAI_BASE_URL must be an absolute URL, got '" + base_url + "'");
  }
  while (!base_url.empty() && base_url.back() == '/') {
    base_url.pop_back();
  }
  return base_url + "/chat/completions";
}

}  // namespace

ServiceConfig load_config_from_env() {
  ServiceConfig config;

  auto api_key = utils::read_env("OPENAI_API_KEY");
  if (!api_key || api_key->empty()) {
    throw ConfigurationError("Missing API key. Set the OPENAI_API_KEY environment variable.");
  }
  config.client.api_key = *api_key;

  if (auto base_url = utils::read_env("OPENAI_BASE_URL")) {
    if (!base_url->empty()) {
      config.client.endpoint = endpoint_from_base_url(*base_url);
    }
  }

  config.client.model = utils::read_env_or("INGREDIENTS_MODEL", kDefaultModel);
  config.client.timeout = std::chrono::milliseconds(
      utils::read_env_integer("INGREDIENTS_TIMEOUT_MS", config.client.timeout.count(), 600000));

  const std::string log_value = utils::read_env_or("INGREDIENTS_LOG", "info");
  auto log_level = find_log_level(log_value);
  if (!log_level) {
    throw ConfigurationError("INGREDIENTS_LOG must be one of off, error, warn, info or debug, got '" + log_value + "'");
  }
  config.client.log_level = *log_level;

  config.server.host = utils::read_env_or("INGREDIENTS_HOST", config.server.host);
  config.server.port = static_cast<unsigned short>(
      utils::read_env_integer("INGREDIENTS_PORT", config.server.port, std::numeric_limits<unsigned short>::max()));
  config.server.threads = static_cast<std::size_t>(
      utils::read_env_integer("INGREDIENTS_THREADS", static_cast<long long>(config.server.threads), 256));

  return config;
}

}  // namespace ingredients
