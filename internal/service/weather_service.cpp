#include "weather_service.hpp"

#include "convert.hpp"
#include "internal/core/weather_segment_cache.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "observe_rpc.hpp"

namespace roadcast::service {

using namespace roadcast::services::v1;

namespace {

core::WeatherQuery ToQuery(const GetWeatherRequest& req) {
  if (!req.has_coord() || !req.has_forecast_time()) {
    throw util::Invalid("coord and forecast_time are required");
  }
  return {ToCoordinate(req.coord()), util::FromProto(req.forecast_time()), req.time_zone()};
}

} // namespace

WeatherService::WeatherService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

GetWeatherResponse WeatherService::GetWeather(const GetWeatherRequest& req) {
  return ObserveRpc("WeatherService.GetWeather", [&] {
    const auto q      = ToQuery(req);
    const auto result = ctx_.weather->Get(q.coord, q.forecast_time, q.time_zone);

    GetWeatherResponse resp;
    *resp.mutable_segment() = ctx_.weather->ToSegment(result, q.forecast_time);
    return resp;
  });
}

GetWeatherBatchResponse WeatherService::GetWeatherBatch(const GetWeatherBatchRequest& req) {
  return ObserveRpc("WeatherService.GetWeatherBatch", [&] {
    std::vector<core::WeatherQuery> queries;
    queries.reserve(req.queries_size());
    for (const auto& q : req.queries()) {
      queries.push_back(ToQuery(q));
    }

    GetWeatherBatchResponse resp;
    for (auto& segment : ctx_.weather->GetMany(queries)) {
      *resp.add_segments() = std::move(segment);
    }
    return resp;
  });
}

} // namespace roadcast::service
