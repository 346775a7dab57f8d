#pragma once

#include <optional>
#include <string>

namespace ingredients::utils {

/**
 * Reads an environment variable with surrounding whitespace removed.
 * Returns std::nullopt when the variable is not set.
 */
std::optional<std::string> read_env(const std::string& name);

/// Value of `name`, or `fallback` when it is unset or blank.
std::string read_env_or(const std::string& name, const std::string& fallback);

/**
 * Reads a positive integer in [1, max_value]. Unset or blank yields `fallback`;
 * anything else that is not such an integer throws ConfigurationError.
 */
long long read_env_integer(const std::string& name, long long fallback, long long max_value);

}  // namespace ingredients::utils
