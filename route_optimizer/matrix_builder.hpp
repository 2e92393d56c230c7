#pragma once
#include "models.hpp"
#include <vector>

// Depot first, then destinations in submission order.
std::vector<Location> route_points(const Location& depot, const std::vector<Stop>& stops);

// n = 1 + stops.size(). Time is distance at assumed_speed_kmh scaled by the
// already-defaulted traffic and weather multipliers. Diagonal is zero.
CostMatrix build_matrices(const Location& depot,
                          const std::vector<Stop>& stops,
                          double traffic_multiplier,
                          double weather_multiplier,
                          double assumed_speed_kmh = 50.0);
