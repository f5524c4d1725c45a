#pragma once

#include <stdexcept>
#include <string>

namespace lipsync::util {

/*
  Central error types.

  These get translated at the process boundary into a JobResult error
  message and a CLI exit code (see error_result.hpp).
*/

// Missing or ambiguous required input, or a template without a required role.
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Remote input could not be fetched within its timeout.
class DownloadError : public std::runtime_error {
 public:
  explicit DownloadError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Inline base64 payload is malformed.
class DecodeError : public std::runtime_error {
 public:
  explicit DecodeError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Realtime channel unreachable within the connect ceiling.
class ConnectTimeout : public std::runtime_error {
 public:
  explicit ConnectTimeout(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Non-success response when enqueueing a job.
class SubmissionError : public std::runtime_error {
 public:
  explicit SubmissionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Status polling failed after the retry budget was spent.
class PollError : public std::runtime_error {
 public:
  explicit PollError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Job reported success but produced nothing retrievable.
class NoOutputError : public std::runtime_error {
 public:
  explicit NoOutputError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Job reported an artifact that cannot be resolved on disk.
class NotFoundError : public std::runtime_error {
 public:
  explicit NotFoundError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Realtime channel closed, read deadline passed, or the wait was cancelled.
class ExecutionError : public std::runtime_error {
 public:
  explicit ExecutionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Raw network failure inside a transport. Callers translate it into the
// error of the step they were performing.
class TransportError : public std::runtime_error {
 public:
  explicit TransportError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace lipsync::util
