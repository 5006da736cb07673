#pragma once

#include "roadcast/services/v1/weather_service.pb.h"
#include "service_context.hpp"

namespace roadcast::service {

class WeatherService {
 public:
  explicit WeatherService(ServiceContext ctx);

  roadcast::services::v1::GetWeatherResponse GetWeather(const roadcast::services::v1::GetWeatherRequest& req);

  // Never fails as a whole; each segment carries its own outcome.
  roadcast::services::v1::GetWeatherBatchResponse GetWeatherBatch(const roadcast::services::v1::GetWeatherBatchRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace roadcast::service
