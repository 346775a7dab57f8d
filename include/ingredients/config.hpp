#pragma once

#include "ingredients/completion_client.hpp"
#include "ingredients/server.hpp"

namespace ingredients {

struct ServiceConfig {
  ClientOptions client;
  ServerOptions server;
};

/**
 * Builds the service configuration from the environment:
 *
 *   OPENAI_API_KEY          required provider secret
 *   OPENAI_BASE_URL         provider base URL; requests go to <base>/chat/completions
 *   INGREDIENTS_MODEL       model identifier (default gpt-4o-mini)
 *   INGREDIENTS_TIMEOUT_MS  upstream timeout in milliseconds (default 5000)
 *   INGREDIENTS_HOST        listen address (default 0.0.0.0)
 *   INGREDIENTS_PORT        listen port (default 8080)
 *   INGREDIENTS_THREADS     server worker threads (default 4)
 *   INGREDIENTS_LOG         off|error|warn|info|debug (default info)
 *
 * Throws ConfigurationError when the API key is missing or a value is malformed.
 * The logger callback is left for the caller to install.
 */
ServiceConfig load_config_from_env();

}  // namespace ingredients
