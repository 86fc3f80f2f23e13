#pragma once

#include <stdexcept>
#include <string>

namespace mlmeta::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

// Malformed YAML/JSON document (store body, stored blob or patch body).
class FormatError : public std::runtime_error {
 public:
  explicit FormatError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Patch document is not a flat JSON object.
class ParseError : public std::runtime_error {
 public:
  explicit ParseError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Backend reported a missing path (status 404).
class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Any other backend failure; carries the backend's own status code.
class BackendError : public std::runtime_error {
 public:
  BackendError(int status_code, const std::string& msg) : std::runtime_error(msg), status_code_(status_code) {
  }

  int StatusCode() const noexcept {
    return status_code_;
  }

 private:
  int status_code_;
};

} // namespace mlmeta::util
