#include "providers.hpp"

#include "internal/util/errors.hpp"

namespace roadcast::providers {

roadcast::core::v1::WeatherPayload UnconfiguredWeatherProvider::Fetch(const spatial::Coordinate&, util::TimePoint, std::chrono::milliseconds) {
  throw util::ProviderUnavailable("weather provider not configured");
}

RouteGeometry UnconfiguredRoutingProvider::Route(const spatial::Coordinate&, const spatial::Coordinate&, std::chrono::milliseconds) {
  throw util::ProviderUnavailable("routing provider not configured");
}

std::vector<DiscoveredPlace> UnconfiguredDiscoveryProvider::PlacesAlong(const std::vector<spatial::Coordinate>&, std::chrono::milliseconds) {
  throw util::ProviderUnavailable("place discovery provider not configured");
}

} // namespace roadcast::providers
