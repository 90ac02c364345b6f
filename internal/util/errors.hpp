#pragma once

#include <stdexcept>
#include <string>

namespace streak::util {

/*
  Central error types.

  Every engine entry point reports failure by throwing one of these.
  Backend errors never escape as sqlite/pqxx types.
*/

// Self-pair or empty user id. Never retried.
class InvalidPair : public std::runtime_error {
 public:
  explicit InvalidPair(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Optimistic retries exhausted. Callers may retry the whole action once.
class ConcurrentUpdateConflict : public std::runtime_error {
 public:
  explicit ConcurrentUpdateConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Caller deadline passed inside a retry loop. State is whatever the last
// successful write produced.
class Timeout : public std::runtime_error {
 public:
  explicit Timeout(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace streak::util
