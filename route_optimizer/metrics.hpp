#pragma once
#include "models.hpp"

struct CostRates {
    double fuel_price_per_liter = 1.5;
    double driver_hourly_rate = 25.0;
};

double round2(double v);

// Distance, time, fuel, cost, speed and stop count, rounded to 2 decimals.
// Quality and collaborator fields are left for the caller to fill.
RouteMetrics compute_metrics(const Route& route, const VehicleSpec& vehicle, const CostRates& rates);
