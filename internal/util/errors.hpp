#pragma once

#include <stdexcept>
#include <string>

namespace sensorlink::util {

/*
  Central error types.

  These get translated later to gRPC status codes (see internal/grpc/grpc_error).
  A duplicate chunk is not an error: it is reported as a write outcome.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Connection failure or timeout. Retried with backoff, never fatal to the queue.
class TransportError : public std::runtime_error {
 public:
  explicit TransportError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Hash or metadata mismatch.
class IntegrityError : public std::runtime_error {
 public:
  explicit IntegrityError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Waiting condition: at least one chunk index of the event is missing.
class IncompleteEvent : public std::runtime_error {
 public:
  explicit IncompleteEvent(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Unknown, revoked or mismatched credential. Fatal to the session.
class UnauthorizedSensor : public std::runtime_error {
 public:
  explicit UnauthorizedSensor(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace sensorlink::util
