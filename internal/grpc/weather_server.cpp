#include "weather_server.hpp"

#include "grpc_error.hpp"

namespace roadcast::grpc {

using namespace roadcast::services::v1;

WeatherServer::WeatherServer(std::shared_ptr<roadcast::service::WeatherService> svc) : service_(std::move(svc)) {
}

::grpc::Status WeatherServer::GetWeather(::grpc::ServerContext*, const GetWeatherRequest* req, GetWeatherResponse* resp) {
  try {
    *resp = service_->GetWeather(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WeatherServer::GetWeatherBatch(::grpc::ServerContext*, const GetWeatherBatchRequest* req, GetWeatherBatchResponse* resp) {
  try {
    *resp = service_->GetWeatherBatch(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace roadcast::grpc
