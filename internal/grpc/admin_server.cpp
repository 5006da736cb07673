#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace roadcast::grpc {

using namespace roadcast::services::v1;
using roadcast::admin::v1::StatsRequest;
using roadcast::admin::v1::StatsResponse;

namespace {

template <typename Fn>
::grpc::Status Call(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace

AdminServer::AdminServer(std::shared_ptr<roadcast::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext*, const StatsRequest* req, StatsResponse* resp) {
  return Call([&] { *resp = service_->Stats(*req); });
}

::grpc::Status AdminServer::Invalidate(::grpc::ServerContext*, const InvalidateRequest* req, InvalidateResponse* resp) {
  return Call([&] { *resp = service_->Invalidate(*req); });
}

::grpc::Status AdminServer::InvalidateRoute(::grpc::ServerContext*, const InvalidateRouteRequest* req, InvalidateRouteResponse* resp) {
  return Call([&] { *resp = service_->InvalidateRoute(*req); });
}

::grpc::Status AdminServer::ReloadSpatialIndex(::grpc::ServerContext*, const ReloadSpatialIndexRequest* req, ReloadSpatialIndexResponse* resp) {
  return Call([&] { *resp = service_->ReloadSpatialIndex(*req); });
}

::grpc::Status AdminServer::PurgeExpired(::grpc::ServerContext*, const PurgeExpiredRequest* req, PurgeExpiredResponse* resp) {
  return Call([&] { *resp = service_->PurgeExpired(*req); });
}

} // namespace roadcast::grpc
