#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace pano::util {

/*
  Central error types.

  The CLI and batch operations translate these into ErrorCode values.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Metadata of one source file could not be determined.
class MetadataUnavailable : public std::runtime_error {
 public:
  explicit MetadataUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ArtifactMissing : public StorageError {
 public:
  explicit ArtifactMissing(const std::string& msg) : StorageError(msg) {
  }
};

class StorageCorrupt : public StorageError {
 public:
  explicit StorageCorrupt(const std::string& msg) : StorageError(msg) {
  }
};

class IndexOutOfRange : public std::runtime_error {
 public:
  explicit IndexOutOfRange(const std::string& msg) : std::runtime_error(msg) {
  }
};

// An external tool exited non-zero or did not produce its output.
class ExternalToolFailure : public std::runtime_error {
 public:
  ExternalToolFailure(std::string tool, int exit_code, const std::string& msg)
      : std::runtime_error(msg), tool_(std::move(tool)), exit_code_(exit_code) {
  }

  const std::string& Tool() const {
    return tool_;
  }

  int ExitCode() const {
    return exit_code_;
  }

 private:
  std::string tool_;
  int         exit_code_;
};

enum class ErrorCode {
  OK = 0,

  NotFound,
  InvalidState,
  InvalidArgument,

  MetadataUnavailable,
  StorageCorrupt,
  StorageError,
  IndexOutOfRange,
  ExternalToolFailure,

  InternalError
};

ErrorCode   ErrorCodeOf(const std::exception& e);
const char* ErrorCodeName(ErrorCode code);

} // namespace pano::util
