#pragma once

#include <stdexcept>
#include <string>

namespace sda::util {

/*
  Central error types.

  The worker loop maps each of these to a broker disposition
  (ack / nack with requeue / nack without requeue).
*/

// Object or row does not exist.
class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Path escapes the configured storage root.
class InvalidPath : public std::runtime_error {
 public:
  explicit InvalidPath(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Message failed schema validation. Permanent.
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Prior state expected in the database is missing.
class LookupError : public std::runtime_error {
 public:
  explicit LookupError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Backend read/write, persistence or size mismatch. Retried via requeue.
class TransientIOError : public std::runtime_error {
 public:
  explicit TransientIOError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Header or ciphertext cannot be decrypted. Permanent.
class DecryptError : public std::runtime_error {
 public:
  explicit DecryptError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PublishError : public std::runtime_error {
 public:
  explicit PublishError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Broker connection dropped. Fatal to the process.
class ConnectionLoss : public std::runtime_error {
 public:
  explicit ConnectionLoss(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace sda::util
