#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/cache/cache_layer.hpp"
#include "internal/providers/providers.hpp"

namespace roadcast::testing {

// Counts calls; can be slowed down, failed, or switched to a new model run.
class FakeWeatherProvider final : public providers::WeatherProvider {
 public:
  roadcast::core::v1::WeatherPayload Fetch(const spatial::Coordinate& location, util::TimePoint at, std::chrono::milliseconds timeout) override;

  void SetModelRun(std::string model_run);
  void SetFailing(bool failing) {
    failing_ = failing;
  }
  void SetDelay(std::chrono::milliseconds delay) {
    delay_ = delay;
  }

  int Calls() const {
    return calls_.load();
  }

 private:
  std::atomic<int>                       calls_{0};
  std::atomic<bool>                      failing_{false};
  std::atomic<std::chrono::milliseconds> delay_{std::chrono::milliseconds(0)};

  mutable std::mutex mutex_;
  std::string        model_run_ = "run-1";
};

class FakeRoutingProvider final : public providers::RoutingProvider {
 public:
  explicit FakeRoutingProvider(providers::RouteGeometry geometry) : geometry_(std::move(geometry)) {
  }

  providers::RouteGeometry Route(const spatial::Coordinate& origin, const spatial::Coordinate& destination,
                                 std::chrono::milliseconds timeout) override;

  void SetFailing(bool failing) {
    failing_ = failing;
  }
  void SetDelay(std::chrono::milliseconds delay) {
    delay_ = delay;
  }

  int Calls() const {
    return calls_.load();
  }

 private:
  providers::RouteGeometry               geometry_;
  std::atomic<int>                       calls_{0};
  std::atomic<bool>                      failing_{false};
  std::atomic<std::chrono::milliseconds> delay_{std::chrono::milliseconds(0)};
};

class FakeDiscoveryProvider final : public providers::PlaceDiscoveryProvider {
 public:
  explicit FakeDiscoveryProvider(std::vector<providers::DiscoveredPlace> places = {}) : places_(std::move(places)) {
  }

  std::vector<providers::DiscoveredPlace> PlacesAlong(const std::vector<spatial::Coordinate>& geometry, std::chrono::milliseconds timeout) override;

  int Calls() const {
    return calls_.load();
  }

 private:
  std::vector<providers::DiscoveredPlace> places_;
  std::atomic<int>                        calls_{0};
};

// Forwards to an inner layer until switched down; then every call throws
// util::CacheLayerDown.
class SwitchableCacheLayer final : public cache::CacheLayer {
 public:
  explicit SwitchableCacheLayer(std::shared_ptr<cache::CacheLayer> inner) : inner_(std::move(inner)) {
  }

  cache::Tier tier() const override {
    return inner_->tier();
  }

  std::optional<cache::CacheEntry> Get(const std::string& key) override;
  void                             Put(const cache::CacheEntry& entry, std::optional<std::chrono::milliseconds> ttl) override;
  bool                             Remove(const std::string& key) override;
  std::uint64_t                    RemoveExpired(util::TimePoint cutoff) override;

  void SetDown(bool down) {
    down_ = down;
  }

 private:
  void ThrowIfDown(const char* op) const;

  std::shared_ptr<cache::CacheLayer> inner_;
  std::atomic<bool>                  down_{false};
};

// Straight line from a to b split into n+1 points, as a routing answer.
providers::RouteGeometry StraightRoute(const spatial::Coordinate& a, const spatial::Coordinate& b, int n, double hours,
                                       const std::string& road_type = "motorway");

} // namespace roadcast::testing
