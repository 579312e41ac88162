#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace cascade::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
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

// Non-cascading delete of an entity that still has live children.
class HasChildren : public std::runtime_error {
 public:
  explicit HasChildren(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PermissionDenied : public std::runtime_error {
 public:
  explicit PermissionDenied(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Lost an optimistic concurrency race on a versioned row.
class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class RateLimited : public std::runtime_error {
 public:
  RateLimited(std::uint64_t active_count, std::uint64_t max_allowed, std::uint64_t retry_after_seconds)
      : std::runtime_error("Rate limit exceeded: " + std::to_string(active_count) + "/" + std::to_string(max_allowed) +
                           " active delete operations. Retry after " + std::to_string(retry_after_seconds) + " seconds."),
        active_count_(active_count),
        max_allowed_(max_allowed),
        retry_after_seconds_(retry_after_seconds) {
  }

  std::uint64_t ActiveCount() const {
    return active_count_;
  }
  std::uint64_t MaxAllowed() const {
    return max_allowed_;
  }
  std::uint64_t RetryAfterSeconds() const {
    return retry_after_seconds_;
  }

 private:
  std::uint64_t active_count_;
  std::uint64_t max_allowed_;
  std::uint64_t retry_after_seconds_;
};

} // namespace cascade::util
