#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/admin_service.hpp"
#include "roadcast/services/v1/admin_service.grpc.pb.h"

namespace roadcast::grpc {

class AdminServer final : public roadcast::services::v1::AdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<roadcast::service::AdminService> svc);

  ::grpc::Status Stats(::grpc::ServerContext*, const roadcast::admin::v1::StatsRequest*, roadcast::admin::v1::StatsResponse*) override;

  ::grpc::Status Invalidate(::grpc::ServerContext*, const roadcast::services::v1::InvalidateRequest*,
                            roadcast::services::v1::InvalidateResponse*) override;

  ::grpc::Status InvalidateRoute(::grpc::ServerContext*, const roadcast::services::v1::InvalidateRouteRequest*,
                                 roadcast::services::v1::InvalidateRouteResponse*) override;

  ::grpc::Status ReloadSpatialIndex(::grpc::ServerContext*, const roadcast::services::v1::ReloadSpatialIndexRequest*,
                                    roadcast::services::v1::ReloadSpatialIndexResponse*) override;

  ::grpc::Status PurgeExpired(::grpc::ServerContext*, const roadcast::services::v1::PurgeExpiredRequest*,
                              roadcast::services::v1::PurgeExpiredResponse*) override;

 private:
  std::shared_ptr<roadcast::service::AdminService> service_;
};

} // namespace roadcast::grpc
