#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"

namespace jobq::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

// Connectivity, constraint and timeout failures from the store. Always
// propagated to the caller; nothing in the core retries them.
class StoreError : public std::runtime_error {
 public:
  StoreError(jobq::db::ErrorCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  jobq::db::ErrorCode code() const {
    return code_;
  }

 private:
  jobq::db::ErrorCode code_;
};

// Payload encode/decode failure at the enqueue/dequeue boundary.
class SerializationError : public std::runtime_error {
 public:
  explicit SerializationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

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

// Throws StoreError when result is not OK.
inline void ThrowIfError(const jobq::db::Result& result, const std::string& prefix) {
  if (!result) {
    throw StoreError(result.code, prefix + ": " + result.message);
  }
}

} // namespace jobq::util
