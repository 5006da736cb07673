#include "tests/support/fakes.hpp"

#include <thread>

#include "internal/spatial/geo.hpp"
#include "internal/util/errors.hpp"

namespace roadcast::testing {

roadcast::core::v1::WeatherPayload FakeWeatherProvider::Fetch(const spatial::Coordinate& location, util::TimePoint at,
                                                              std::chrono::milliseconds) {
  calls_++;
  const auto delay = delay_.load();
  if (delay.count() > 0) std::this_thread::sleep_for(delay);
  if (failing_) {
    throw util::ProviderUnavailable("fake weather provider is down");
  }

  roadcast::core::v1::WeatherPayload payload;
  payload.set_temperature(20.0 + location.lat / 10.0);
  payload.set_condition("clear");
  payload.set_wind_speed(3.5);
  payload.set_humidity(40.0);
  *payload.mutable_forecast_time() = util::ToProto(at);

  std::lock_guard lock(mutex_);
  payload.set_model_run(model_run_);
  return payload;
}

void FakeWeatherProvider::SetModelRun(std::string model_run) {
  std::lock_guard lock(mutex_);
  model_run_ = std::move(model_run);
}

providers::RouteGeometry FakeRoutingProvider::Route(const spatial::Coordinate&, const spatial::Coordinate&, std::chrono::milliseconds) {
  calls_++;
  const auto delay = delay_.load();
  if (delay.count() > 0) std::this_thread::sleep_for(delay);
  if (failing_) {
    throw util::ProviderUnavailable("fake routing provider is down");
  }
  return geometry_;
}

std::vector<providers::DiscoveredPlace> FakeDiscoveryProvider::PlacesAlong(const std::vector<spatial::Coordinate>&, std::chrono::milliseconds) {
  calls_++;
  return places_;
}

void SwitchableCacheLayer::ThrowIfDown(const char* op) const {
  if (down_) {
    throw util::CacheLayerDown(std::string("switched off: ") + op);
  }
}

std::optional<cache::CacheEntry> SwitchableCacheLayer::Get(const std::string& key) {
  ThrowIfDown("get");
  return inner_->Get(key);
}

void SwitchableCacheLayer::Put(const cache::CacheEntry& entry, std::optional<std::chrono::milliseconds> ttl) {
  ThrowIfDown("put");
  inner_->Put(entry, ttl);
}

bool SwitchableCacheLayer::Remove(const std::string& key) {
  ThrowIfDown("remove");
  return inner_->Remove(key);
}

std::uint64_t SwitchableCacheLayer::RemoveExpired(util::TimePoint cutoff) {
  ThrowIfDown("remove expired");
  return inner_->RemoveExpired(cutoff);
}

providers::RouteGeometry StraightRoute(const spatial::Coordinate& a, const spatial::Coordinate& b, int n, double hours, const std::string& road_type) {
  providers::RouteGeometry g;
  for (int i = 0; i <= n; ++i) {
    const double t = static_cast<double>(i) / n;
    g.points.push_back({a.lat + (b.lat - a.lat) * t, a.lon + (b.lon - a.lon) * t});
  }
  const double length_m = spatial::PathLengthMeters(g.points);
  g.distance_km         = length_m / 1000.0;
  g.duration_hours      = hours;
  g.steps.push_back({road_type, "test road", length_m});
  return g;
}

} // namespace roadcast::testing
