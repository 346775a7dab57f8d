#pragma once

#include <cstdlib>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>

namespace ingredients::testing {

inline void set_env(const std::string& name, const std::string& value) {
#if defined(_WIN32)
  _putenv_s(name.c_str(), value.c_str());
#else
  ::setenv(name.c_str(), value.c_str(), 1);
#endif
}

inline void unset_env(const std::string& name) {
#if defined(_WIN32)
  _putenv_s(name.c_str(), "");
#else
  ::unsetenv(name.c_str());
#endif
}

/**
 * Overrides environment variables for the lifetime of the object and restores
 * the previous values afterwards. Every variable the service reads is cleared
 * on construction so tests start from a known environment.
 */
class ScopedEnvironment {
public:
  ScopedEnvironment() {
    for (const char* name : {"OPENAI_API_KEY", "OPENAI_BASE_URL", "INGREDIENTS_MODEL", "INGREDIENTS_TIMEOUT_MS",
                             "INGREDIENTS_HOST", "INGREDIENTS_PORT", "INGREDIENTS_THREADS", "INGREDIENTS_LOG"}) {
      unset(name);
    }
  }

  ScopedEnvironment(const ScopedEnvironment&) = delete;
  ScopedEnvironment& operator=(const ScopedEnvironment&) = delete;

  ~ScopedEnvironment() {
    for (const auto& [name, previous] : saved_) {
      if (previous.has_value()) {
        set_env(name, *previous);
      } else {
        unset_env(name);
      }
    }
  }

  void set(const std::string& name, const std::string& value) {
    remember(name);
    set_env(name, value);
  }

  void unset(const std::string& name) {
    remember(name);
    unset_env(name);
  }

private:
  void remember(const std::string& name) {
    if (saved_.count(name) != 0) {
      return;
    }
    const char* existing = std::getenv(name.c_str());
    saved_[name] = existing ? std::optional<std::string>(existing) : std::nullopt;
  }

  std::map<std::string, std::optional<std::string>> saved_;
};

}  // namespace ingredients::testing
