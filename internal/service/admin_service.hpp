#pragma once

#include "roadcast/admin/v1/stats.pb.h"
#include "roadcast/services/v1/admin_service.pb.h"
#include "service_context.hpp"

namespace roadcast::service {

class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  roadcast::admin::v1::StatsResponse Stats(const roadcast::admin::v1::StatsRequest& req);

  roadcast::services::v1::InvalidateResponse Invalidate(const roadcast::services::v1::InvalidateRequest& req);

  roadcast::services::v1::InvalidateRouteResponse InvalidateRoute(const roadcast::services::v1::InvalidateRouteRequest& req);

  roadcast::services::v1::ReloadSpatialIndexResponse ReloadSpatialIndex(const roadcast::services::v1::ReloadSpatialIndexRequest& req);

  roadcast::services::v1::PurgeExpiredResponse PurgeExpired(const roadcast::services::v1::PurgeExpiredRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace roadcast::service
