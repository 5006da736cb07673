#pragma once

#include <stdexcept>
#include <string>

namespace roadcast::util {

/*
  Central error types.

  ProviderUnavailable is retryable, Invalid never is. CacheLayerDown is
  raised by cache layers and absorbed by TieredCache; it must not reach
  a caller of the engine.

  These get translated later to gRPC status codes.
*/

class ProviderUnavailable : public std::runtime_error {
 public:
  explicit ProviderUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Invalid : public std::runtime_error {
 public:
  explicit Invalid(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CacheLayerDown : public std::runtime_error {
 public:
  explicit CacheLayerDown(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace roadcast::util
