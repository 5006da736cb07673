#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/weather_service.hpp"
#include "roadcast/services/v1/weather_service.grpc.pb.h"

namespace roadcast::grpc {

class WeatherServer final : public roadcast::services::v1::WeatherService::Service {
 public:
  explicit WeatherServer(std::shared_ptr<roadcast::service::WeatherService> svc);

  ::grpc::Status GetWeather(::grpc::ServerContext*, const roadcast::services::v1::GetWeatherRequest*,
                            roadcast::services::v1::GetWeatherResponse*) override;

  ::grpc::Status GetWeatherBatch(::grpc::ServerContext*, const roadcast::services::v1::GetWeatherBatchRequest*,
                                 roadcast::services::v1::GetWeatherBatchResponse*) override;

 private:
  std::shared_ptr<roadcast::service::WeatherService> service_;
};

} // namespace roadcast::grpc
