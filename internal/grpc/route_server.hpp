#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/route_service.hpp"
#include "roadcast/services/v1/route_service.grpc.pb.h"

namespace roadcast::grpc {

class RouteServer final : public roadcast::services::v1::RouteService::Service {
 public:
  explicit RouteServer(std::shared_ptr<roadcast::service::RouteService> svc);

  ::grpc::Status GetRoute(::grpc::ServerContext*, const roadcast::services::v1::GetRouteRequest*, roadcast::services::v1::GetRouteResponse*) override;

  ::grpc::Status PlanTrip(::grpc::ServerContext*, const roadcast::services::v1::PlanTripRequest*, roadcast::services::v1::PlanTripResponse*) override;

 private:
  std::shared_ptr<roadcast::service::RouteService> service_;
};

} // namespace roadcast::grpc
