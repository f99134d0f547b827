#pragma once

#include <stdexcept>
#include <string>

namespace trackq::util {

/*
  Central error types.

  Caller-facing errors are raised synchronously by the queue API and are
  never retried. Pipeline errors are raised by collaborators while an item
  executes; the retry policy classifies them at the worker boundary.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DuplicateId : public std::runtime_error {
 public:
  explicit DuplicateId(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidTransition : public std::runtime_error {
 public:
  explicit InvalidTransition(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// ---------------------------------------------------------------------
// Pipeline errors
// ---------------------------------------------------------------------

class PipelineError : public std::runtime_error {
 public:
  explicit PipelineError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// network timeout, 5xx, dropped connection
class TransientError : public PipelineError {
 public:
  explicit TransientError(const std::string& msg) : PipelineError(msg) {
  }
};

// credential rejected or expired
class AuthError : public PipelineError {
 public:
  explicit AuthError(const std::string& msg) : PipelineError(msg) {
  }
};

class DecryptionError : public PipelineError {
 public:
  explicit DecryptionError(const std::string& msg) : PipelineError(msg) {
  }
};

// write failure or invalid local path
class DiskError : public PipelineError {
 public:
  explicit DiskError(const std::string& msg) : PipelineError(msg) {
  }
};

// catalog reports the id as missing or not streamable
class ContentUnavailable : public PipelineError {
 public:
  explicit ContentUnavailable(const std::string& msg) : PipelineError(msg) {
  }
};

} // namespace trackq::util
