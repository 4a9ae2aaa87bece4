#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace jobq::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace jobq::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const SerializationError*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (const auto* store = dynamic_cast<const StoreError*>(&e)) {
    switch (store->code()) {
      case jobq::db::ErrorCode::Busy:
        return {::grpc::StatusCode::UNAVAILABLE, e.what()};
      case jobq::db::ErrorCode::AlreadyExists:
        return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
      default:
        return {::grpc::StatusCode::INTERNAL, e.what()};
    }
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace jobq::grpc
