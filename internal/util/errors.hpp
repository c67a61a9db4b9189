#pragma once

#include <stdexcept>
#include <string>

namespace kbsync::util {

/*
  Central error types.

  Raised by the ledger layer; pipeline stages catch them per record so a
  single bad row never aborts a batch.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Ledger could not be read or written (busy, I/O, corruption).
class LedgerUnavailable : public std::runtime_error {
 public:
  explicit LedgerUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A configured root could not be enumerated.
class FilesystemError : public std::runtime_error {
 public:
  explicit FilesystemError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace kbsync::util
