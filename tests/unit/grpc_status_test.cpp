#include <cassert>
#include <iostream>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/route_server.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/route_service.hpp"
#include "internal/util/errors.hpp"

namespace {

roadcast::factory::Engine BuildTestEngine() {
  auto repository = std::make_shared<roadcast::db::memory::MemoryRepository>();
  return roadcast::factory::BuildEngine(repository, roadcast::config::EngineOptions{}, roadcast::factory::UnconfiguredProviders());
}

void FillPlace(roadcast::core::v1::PlaceRef* place, const char* name, double lat, double lon) {
  place->set_name(name);
  place->set_place_type("city");
  place->set_region("IR");
  place->set_time_zone("Asia/Tehran");
  place->mutable_coord()->set_lat(lat);
  place->mutable_coord()->set_lon(lon);
}

void TestErrorTaxonomyMapsToStatusCodes() {
  using roadcast::grpc::ToStatus;

  assert(ToStatus(roadcast::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(roadcast::util::Invalid("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(roadcast::util::ProviderUnavailable("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(roadcast::util::CacheLayerDown("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(roadcast::util::NotFound("route:a:b")).error_message() == "route:a:b");
}

void TestInvalidateWithEmptyKeyReturnsInvalidArgument() {
  auto engine = BuildTestEngine();
  auto svc    = std::make_shared<roadcast::service::AdminService>(engine.Context());
  roadcast::grpc::AdminServer server(svc);

  roadcast::services::v1::InvalidateRequest  req;
  roadcast::services::v1::InvalidateResponse resp;
  ::grpc::ServerContext                      grpc_ctx;

  const auto status = server.Invalidate(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  req.set_key("wx:missing:202601011200:0");
  ::grpc::ServerContext missing_ctx;
  assert(server.Invalidate(&missing_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);

  engine.janitor->Stop();
}

void TestStatsOnFreshEngineIsOk() {
  auto engine = BuildTestEngine();
  auto svc    = std::make_shared<roadcast::service::AdminService>(engine.Context());
  roadcast::grpc::AdminServer server(svc);

  roadcast::admin::v1::StatsRequest  req;
  roadcast::admin::v1::StatsResponse resp;
  ::grpc::ServerContext              grpc_ctx;

  const auto status = server.Stats(&grpc_ctx, &req, &resp);
  assert(status.ok());
  assert(resp.routes().requests() == 0);
  assert(resp.graph().edges() == 0);
  assert(resp.weather().generation() == "0");

  engine.janitor->Stop();
}

void TestRouteWithoutProviderReturnsUnavailable() {
  auto engine = BuildTestEngine();
  auto svc    = std::make_shared<roadcast::service::RouteService>(engine.Context());
  roadcast::grpc::RouteServer server(svc);

  roadcast::services::v1::GetRouteRequest req;
  FillPlace(req.mutable_source(), "Tehran", 35.6892, 51.3890);
  FillPlace(req.mutable_target(), "Mashhad", 36.2605, 59.6168);
  roadcast::services::v1::GetRouteResponse resp;
  ::grpc::ServerContext                    grpc_ctx;

  const auto status = server.GetRoute(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(!resp.has_route());

  engine.janitor->Stop();
}

void TestRouteBetweenSamePlaceIsInvalid() {
  auto engine = BuildTestEngine();
  auto svc    = std::make_shared<roadcast::service::RouteService>(engine.Context());
  roadcast::grpc::RouteServer server(svc);

  roadcast::services::v1::GetRouteRequest req;
  FillPlace(req.mutable_source(), "Tehran", 35.6892, 51.3890);
  FillPlace(req.mutable_target(), "Tehran", 35.6892, 51.3890);
  roadcast::services::v1::GetRouteResponse resp;
  ::grpc::ServerContext                    grpc_ctx;

  assert(server.GetRoute(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  engine.janitor->Stop();
}

} // namespace

int main() {
  TestErrorTaxonomyMapsToStatusCodes();
  TestInvalidateWithEmptyKeyReturnsInvalidArgument();
  TestStatsOnFreshEngineIsOk();
  TestRouteWithoutProviderReturnsUnavailable();
  TestRouteBetweenSamePlaceIsInvalid();

  std::cout << "grpc_status_test: pass" << std::endl;
  return 0;
}
