#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace roadcast::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace roadcast::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const Invalid*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  // A layer outage is normally absorbed by the tiered cache; reaching here
  // means both tiers were needed and down.
  if (dynamic_cast<const ProviderUnavailable*>(&e) || dynamic_cast<const CacheLayerDown*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace roadcast::grpc
