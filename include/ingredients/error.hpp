#pragma once

#include <stdexcept>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace ingredients {

class IngredientsError : public std::runtime_error {
public:
  explicit IngredientsError(const std::string& message)
      : std::runtime_error(message) {}
};

class ConfigurationError : public IngredientsError {
public:
  explicit ConfigurationError(const std::string& message)
      : IngredientsError(message) {}
};

class InvalidRequestError : public IngredientsError {
public:
  explicit InvalidRequestError(const std::string& message)
      : IngredientsError(message) {}
};

class ServerError : public IngredientsError {
public:
  explicit ServerError(const std::string& message)
      : IngredientsError(message) {}
};

class UpstreamTransportError : public IngredientsError {
public:
  explicit UpstreamTransportError(const std::string& message)
      : IngredientsError(message) {}
};

/// The provider did not answer within the configured timeout. Callers may retry.
class UpstreamTimeoutError : public UpstreamTransportError {
public:
  using UpstreamTransportError::UpstreamTransportError;
};

class UpstreamStatusError : public UpstreamTransportError {
public:
  UpstreamStatusError(const std::string& message, long status_code, nlohmann::json error_body)
      : UpstreamTransportError(message),
        status_code_(status_code),
        error_body_(std::move(error_body)) {}

  long status_code() const { return status_code_; }
  const nlohmann::json& error_body() const { return error_body_; }

private:
  long status_code_;
  nlohmann::json error_body_;
};

class UpstreamParseError : public IngredientsError {
public:
  UpstreamParseError(const std::string& message, std::string raw_body)
      : IngredientsError(message), raw_body_(std::move(raw_body)) {}

  const std::string& raw_body() const { return raw_body_; }

private:
  std::string raw_body_;
};

class EmptyChoicesError : public UpstreamParseError {
public:
  using UpstreamParseError::UpstreamParseError;
};

/// The completion content is not a JSON object with a string `classification`.
class ClassificationParseError : public IngredientsError {
public:
  ClassificationParseError(const std::string& message, std::string content)
      : IngredientsError(message), content_(std::move(content)) {}

  const std::string& content() const { return content_; }

private:
  std::string content_;
};

}  // namespace ingredients
