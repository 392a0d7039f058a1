#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace upload::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
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

class PlanLimitExceeded : public std::runtime_error {
 public:
  PlanLimitExceeded(const std::string& msg, std::uint64_t limit_bytes) : std::runtime_error(msg), limit_bytes_(limit_bytes) {
  }

  std::uint64_t LimitBytes() const {
    return limit_bytes_;
  }

 private:
  std::uint64_t limit_bytes_;
};

// Retryable: tenant storage is still being provisioned.
class BucketNotReady : public std::runtime_error {
 public:
  explicit BucketNotReady(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StateConflict : public std::runtime_error {
 public:
  StateConflict(const std::string& msg, std::string current, std::string target)
      : std::runtime_error(msg), current_(std::move(current)), target_(std::move(target)) {
  }

  const std::string& Current() const {
    return current_;
  }
  const std::string& Target() const {
    return target_;
  }

 private:
  std::string current_;
  std::string target_;
};

class SizeMismatch : public std::runtime_error {
 public:
  SizeMismatch(const std::string& msg, std::uint64_t expected, std::uint64_t observed)
      : std::runtime_error(msg), expected_(expected), observed_(observed) {
  }

  std::uint64_t Expected() const {
    return expected_;
  }
  std::uint64_t Observed() const {
    return observed_;
  }

 private:
  std::uint64_t expected_;
  std::uint64_t observed_;
};

class TransferAssemblyFailed : public std::runtime_error {
 public:
  explicit TransferAssemblyFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

class MetadataPersistenceFailed : public std::runtime_error {
 public:
  explicit MetadataPersistenceFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Retryable: object store timeout or transport failure.
class RemoteUnavailable : public std::runtime_error {
 public:
  explicit RemoteUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace upload::util
