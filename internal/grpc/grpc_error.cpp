#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace impact::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace impact::util;

  if (dynamic_cast<const ValidationError*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const ServiceUnavailable*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }
  if (dynamic_cast<const TransactionConflict*>(&e)) {
    return {::grpc::StatusCode::ABORTED, e.what()};
  }
  if (dynamic_cast<const DeadlineExceeded*>(&e)) {
    return {::grpc::StatusCode::DEADLINE_EXCEEDED, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace impact::grpc
