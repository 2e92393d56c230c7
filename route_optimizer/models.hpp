#pragma once
#include <optional>
#include <string>
#include <vector>

struct Location {
    double lat;
    double lng;
};

struct Stop {
    Location location;
    std::string id;
    int priority = 1;
    std::optional<double> service_time_minutes;
};

struct Constraints {
    std::optional<int> max_capacity;          // one unit of demand per stop
    std::optional<int> max_duration_minutes;
};

enum class OptimizeFor { Time, Distance };

// Only optimize_for changes behavior; the avoid/prefer flags are carried
// through to the caller untouched.
struct Preferences {
    OptimizeFor optimize_for = OptimizeFor::Time;
    bool avoid_tolls = false;
    bool avoid_highways = false;
    bool prefer_main_roads = true;
    bool consider_traffic = true;
    bool consider_weather = true;
};

using Matrix = std::vector<std::vector<double>>;

// Node 0 is the depot, node i > 0 is destinations[i - 1].
struct CostMatrix {
    Matrix distance_km;
    Matrix time_minutes;

    int size() const { return (int)distance_km.size(); }
};

enum class Quality { Optimal, HeuristicFallback };

inline const char* quality_name(Quality q) {
    return q == Quality::Optimal ? "optimal" : "heuristic_fallback";
}

struct RouteStop {
    Stop stop;
    int node;
    int sequence;
    double distance_from_previous = 0.0;
    double time_from_previous = 0.0;
    double cumulative_distance_km = 0.0;
    double cumulative_time_minutes = 0.0;
};

struct Route {
    std::vector<RouteStop> stops;
    double total_distance_km = 0.0;
    double total_time_minutes = 0.0;
    std::vector<int> sequence;
};

struct VehicleSpec {
    std::string vehicle_type;
    std::string fuel_type;
    double fuel_efficiency_l_per_100km;
    double cost_per_km;
    double emission_kg_co2_per_km;
};

struct RouteMetrics {
    double total_distance_km = 0.0;
    double total_time_minutes = 0.0;
    double fuel_consumed_liters = 0.0;
    double estimated_cost_usd = 0.0;
    double average_speed_kmh = 0.0;
    double traffic_impact = 1.0;
    double weather_impact = 1.0;
    bool traffic_degraded = false;
    bool weather_degraded = false;
    Quality quality = Quality::Optimal;
    bool search_converged = false;
    int stops_count = 0;
    std::string vehicle_type;
};

struct OptimizeRequest {
    Location origin;
    std::vector<Stop> destinations;
    std::string vehicle_type;
    Constraints constraints;
    Preferences preferences;
    std::optional<double> time_limit_seconds;   // overrides the configured budget
};

struct OptimizationResult {
    std::string route_id;
    std::string timestamp;
    Route optimized_route;
    RouteMetrics metrics;
};
