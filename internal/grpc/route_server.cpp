#include "route_server.hpp"

#include "grpc_error.hpp"

namespace roadcast::grpc {

using namespace roadcast::services::v1;

RouteServer::RouteServer(std::shared_ptr<roadcast::service::RouteService> svc) : service_(std::move(svc)) {
}

::grpc::Status RouteServer::GetRoute(::grpc::ServerContext*, const GetRouteRequest* req, GetRouteResponse* resp) {
  try {
    *resp = service_->GetRoute(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RouteServer::PlanTrip(::grpc::ServerContext*, const PlanTripRequest* req, PlanTripResponse* resp) {
  try {
    *resp = service_->PlanTrip(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace roadcast::grpc
