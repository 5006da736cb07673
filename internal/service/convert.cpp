#include "convert.hpp"

namespace roadcast::service {

spatial::Coordinate ToCoordinate(const roadcast::core::v1::LatLng& p) {
  return {p.lat(), p.lon()};
}

graph::PlaceInput ToPlaceInput(const roadcast::core::v1::PlaceRef& ref) {
  graph::PlaceInput in;
  in.name       = ref.name();
  in.place_type = ref.place_type();
  in.region     = ref.region();
  in.coord      = ToCoordinate(ref.coord());
  in.time_zone  = ref.time_zone();
  return in;
}

} // namespace roadcast::service
