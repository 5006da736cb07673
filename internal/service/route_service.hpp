#pragma once

#include "roadcast/services/v1/route_service.pb.h"
#include "service_context.hpp"

namespace roadcast::service {

class RouteService {
 public:
  explicit RouteService(ServiceContext ctx);

  roadcast::services::v1::GetRouteResponse GetRoute(const roadcast::services::v1::GetRouteRequest& req);

  roadcast::services::v1::PlanTripResponse PlanTrip(const roadcast::services::v1::PlanTripRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace roadcast::service
