#include "route_service.hpp"

#include "convert.hpp"
#include "internal/core/route_cache_coordinator.hpp"
#include "internal/core/trip_planner.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "observe_rpc.hpp"

namespace roadcast::service {

using namespace roadcast::services::v1;

namespace {

void RequirePlaces(const roadcast::core::v1::PlaceRef& source, const roadcast::core::v1::PlaceRef& target) {
  if (source.name().empty() || target.name().empty()) {
    throw util::Invalid("source and target places are required");
  }
}

} // namespace

RouteService::RouteService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

GetRouteResponse RouteService::GetRoute(const GetRouteRequest& req) {
  return ObserveRpc("RouteService.GetRoute", [&] {
    RequirePlaces(req.source(), req.target());

    GetRouteResponse resp;
    *resp.mutable_route() = ctx_.routes->GetRoute(ToPlaceInput(req.source()), ToPlaceInput(req.target()));
    return resp;
  });
}

PlanTripResponse RouteService::PlanTrip(const PlanTripRequest& req) {
  return ObserveRpc("RouteService.PlanTrip", [&] {
    RequirePlaces(req.source(), req.target());
    const auto departure = req.has_departure() ? util::FromProto(req.departure()) : util::Now();

    auto             plan = ctx_.trips->PlanTrip(ToPlaceInput(req.source()), ToPlaceInput(req.target()), departure);
    PlanTripResponse resp;
    *resp.mutable_route() = std::move(plan.route);
    for (auto& segment : plan.segments) {
      *resp.add_segments() = std::move(segment);
    }
    return resp;
  });
}

} // namespace roadcast::service
