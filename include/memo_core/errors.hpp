#pragma once

#include <stdexcept>
#include <string>

namespace memo_core {

// Coarse cause of a failure, so callers can branch without matching on messages
enum class ErrorKind { Configuration, Hashing, ServiceCall, Persistence, Unexpected };

std::string to_string(ErrorKind kind);

class MemoError : public std::runtime_error {
 public:
  MemoError(ErrorKind kind, const std::string& message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const noexcept {
    return kind_;
  }

 private:
  ErrorKind kind_;
};

// Missing credentials, missing directories, unparsable settings. Always fatal.
class ConfigurationError : public MemoError {
 public:
  explicit ConfigurationError(const std::string& message)
      : MemoError(ErrorKind::Configuration, message) {}
};

class HashingError : public MemoError {
 public:
  explicit HashingError(const std::string& message) : MemoError(ErrorKind::Hashing, message) {}
};

// Transport failures, non-2xx responses and malformed payloads from the AI service
class ServiceError : public MemoError {
 public:
  explicit ServiceError(const std::string& message)
      : MemoError(ErrorKind::ServiceCall, message) {}
};

class PersistenceError : public MemoError {
 public:
  explicit PersistenceError(const std::string& message)
      : MemoError(ErrorKind::Persistence, message) {}
};

}  // namespace memo_core
