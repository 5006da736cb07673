#pragma once

#include "internal/graph/road_graph_store.hpp"
#include "roadcast/core/v1/types.pb.h"

namespace roadcast::service {

spatial::Coordinate ToCoordinate(const roadcast::core::v1::LatLng& p);
graph::PlaceInput   ToPlaceInput(const roadcast::core::v1::PlaceRef& ref);

} // namespace roadcast::service
