#pragma once
#include "models.hpp"

// Great-circle distance in kilometres (haversine, R = 6371 km).
double haversine_km(const Location& a, const Location& b);

bool is_valid_location(const Location& p);
