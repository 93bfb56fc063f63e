#pragma once

#include <stdexcept>
#include <string>

namespace cdn::util {

/*
  Central error types raised by the configuration store.

  cdnctl maps every one of them to exit status 1.
*/

// Referenced origin / rule does not exist.
class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Unique constraint violated (origin name).
class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Malformed input rejected before any write.
class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Illegal status transition or concurrent modification.
class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Store cannot be opened, read or written (permissions, disk full, lock timeout).
class StorageUnavailable : public std::runtime_error {
 public:
  explicit StorageUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace cdn::util
