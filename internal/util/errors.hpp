#pragma once

#include <stdexcept>
#include <string>

namespace inkvault::util {

/*
  Central error types.

  Contained at the EditingSession boundary and turned into a log line or a
  status shown by the rendering surface. None of them ends a session.
*/

// Read of an index (or bookmark target) that has no record.
class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A stored record exists but cannot be decoded. Indicates storage corruption.
class SerializationError : public std::runtime_error {
 public:
  explicit SerializationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Undo/redo/bookmark jump with no valid target. A boundary, not a failure.
class NoSuchTransition : public std::runtime_error {
 public:
  explicit NoSuchTransition(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A durable write did not complete. Existing records are untouched.
class IOError : public std::runtime_error {
 public:
  explicit IOError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace inkvault::util
