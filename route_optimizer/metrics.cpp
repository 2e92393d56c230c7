#include "metrics.hpp"
#include <cmath>
using namespace std;

double round2(double v)
{
    return round(v * 100.0) / 100.0;
}

RouteMetrics compute_metrics(const Route& route, const VehicleSpec& vehicle, const CostRates& rates)
{
    double distance = route.total_distance_km;
    double time = route.total_time_minutes;

    double fuel = vehicle.fuel_efficiency_l_per_100km > 0
                      ? distance * vehicle.fuel_efficiency_l_per_100km / 100.0
                      : 0.0;
    double cost = fuel * rates.fuel_price_per_liter + (time / 60.0) * rates.driver_hourly_rate;
    double speed = time > 0 ? distance / (time / 60.0) : 0.0;

    RouteMetrics m;
    m.total_distance_km = round2(distance);
    m.total_time_minutes = round2(time);
    m.fuel_consumed_liters = round2(fuel);
    m.estimated_cost_usd = round2(cost);
    m.average_speed_kmh = round2(speed);
    m.stops_count = route.stops.empty() ? 0 : (int)route.stops.size() - 1;
    m.vehicle_type = vehicle.vehicle_type;
    return m;
}
