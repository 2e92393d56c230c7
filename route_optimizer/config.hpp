#pragma once
#include "log.hpp"
#include "solver.hpp"
#include "vehicles.hpp"
#include "nlohmann/json.hpp"
#include <string>

struct OptimizerConfig {
    double optimization_timeout_seconds = 30.0;
    int max_stops_per_route = 50;
    double assumed_speed_kmh = 50.0;
    double waiting_slack_minutes = 30.0;
    int cost_scale = 100;
    double fuel_price_per_liter = 1.5;
    double driver_hourly_rate = 25.0;
    double weather_multiplier_cap = 2.0;
    double traffic_multiplier_limit = 10.0;
    int traffic_cache_ttl_seconds = 300;
    int route_store_ttl_hours = 24;
    std::string default_vehicle_type = "diesel_truck";
    SolverStrategy solver = SolverStrategy::Search;
    LogLevel log_level = LogLevel::Info;
    VehicleTable vehicles = default_vehicle_specs();
};

// Missing keys keep their defaults. Throws ValidationError on bad values.
OptimizerConfig config_from_json(const nlohmann::json& j);

// Empty path means defaults. Environment overrides are applied last.
OptimizerConfig load_config(const std::string& path);

void apply_env_overrides(OptimizerConfig& cfg);
void validate_config(const OptimizerConfig& cfg);

bool parse_solver_strategy(const std::string& name, SolverStrategy& out);
const char* solver_strategy_name(SolverStrategy s);
