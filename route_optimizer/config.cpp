#include "config.hpp"
#include "errors.hpp"
#include <cmath>
#include <cstdlib>
#include <fstream>
using namespace std;
using json = nlohmann::json;

bool parse_solver_strategy(const string& name, SolverStrategy& out)
{
    if (name == "search") out = SolverStrategy::Search;
    else if (name == "greedy") out = SolverStrategy::Greedy;
    else return false;
    return true;
}

const char* solver_strategy_name(SolverStrategy s)
{
    return s == SolverStrategy::Search ? "search" : "greedy";
}

static VehicleSpec vehicle_from_json(const string& type, const json& v, const VehicleSpec* base)
{
    VehicleSpec spec = base ? *base : VehicleSpec{type, "diesel", 35.0, 0.85, 0.162};
    spec.vehicle_type = type;
    spec.fuel_type = v.value("fuel_type", spec.fuel_type);
    spec.fuel_efficiency_l_per_100km = v.value("fuel_efficiency_l_per_100km", spec.fuel_efficiency_l_per_100km);
    spec.cost_per_km = v.value("cost_per_km", spec.cost_per_km);
    spec.emission_kg_co2_per_km = v.value("emission_kg_co2_per_km", spec.emission_kg_co2_per_km);
    return spec;
}

OptimizerConfig config_from_json(const json& j)
{
    OptimizerConfig cfg;
    if (!j.is_object()) throw ValidationError("config must be a JSON object");

    try {
        cfg.optimization_timeout_seconds = j.value("optimization_timeout_seconds", cfg.optimization_timeout_seconds);
        cfg.max_stops_per_route = j.value("max_stops_per_route", cfg.max_stops_per_route);
        cfg.assumed_speed_kmh = j.value("assumed_speed_kmh", cfg.assumed_speed_kmh);
        cfg.waiting_slack_minutes = j.value("waiting_slack_minutes", cfg.waiting_slack_minutes);
        cfg.cost_scale = j.value("cost_scale", cfg.cost_scale);
        cfg.fuel_price_per_liter = j.value("fuel_price_per_liter", cfg.fuel_price_per_liter);
        cfg.driver_hourly_rate = j.value("driver_hourly_rate", cfg.driver_hourly_rate);
        cfg.weather_multiplier_cap = j.value("weather_multiplier_cap", cfg.weather_multiplier_cap);
        cfg.traffic_multiplier_limit = j.value("traffic_multiplier_limit", cfg.traffic_multiplier_limit);
        cfg.traffic_cache_ttl_seconds = j.value("traffic_cache_ttl_seconds", cfg.traffic_cache_ttl_seconds);
        cfg.route_store_ttl_hours = j.value("route_store_ttl_hours", cfg.route_store_ttl_hours);
        cfg.default_vehicle_type = j.value("default_vehicle_type", cfg.default_vehicle_type);

        if (j.contains("solver")) {
            string name = j["solver"];
            if (!parse_solver_strategy(name, cfg.solver))
                throw ValidationError("unknown solver strategy: " + name);
        }
        if (j.contains("log_level")) {
            string name = j["log_level"];
            if (!parse_log_level(name, cfg.log_level))
                throw ValidationError("unknown log level: " + name);
        }
        if (j.contains("vehicles")) {
            for (auto& [type, v] : j["vehicles"].items()) {
                auto it = cfg.vehicles.find(type);
                const VehicleSpec* base = it == cfg.vehicles.end() ? nullptr : &it->second;
                cfg.vehicles[type] = vehicle_from_json(type, v, base);
            }
        }
    } catch (const json::exception& e) {
        throw ValidationError(string("malformed config: ") + e.what());
    }

    validate_config(cfg);
    return cfg;
}

static bool env_value(const char* name, string& out)
{
    const char* v = getenv(name);
    if (!v || !*v) return false;
    out = v;
    return true;
}

void apply_env_overrides(OptimizerConfig& cfg)
{
    string v;
    try {
        if (env_value("OPTIMIZATION_TIMEOUT", v)) cfg.optimization_timeout_seconds = stod(v);
        if (env_value("MAX_STOPS_PER_ROUTE", v)) cfg.max_stops_per_route = stoi(v);
    } catch (const exception&) {
        throw ValidationError("bad numeric environment override: " + v);
    }
    if (env_value("DEFAULT_VEHICLE_TYPE", v)) cfg.default_vehicle_type = v;
    if (env_value("LOG_LEVEL", v) && !parse_log_level(v, cfg.log_level))
        throw ValidationError("unknown LOG_LEVEL: " + v);
}

void validate_config(const OptimizerConfig& cfg)
{
    if (!(cfg.optimization_timeout_seconds > 0))
        throw ValidationError("optimization_timeout_seconds must be positive");
    if (cfg.max_stops_per_route < 1)
        throw ValidationError("max_stops_per_route must be at least 1");
    if (!(cfg.assumed_speed_kmh > 0))
        throw ValidationError("assumed_speed_kmh must be positive");
    if (cfg.waiting_slack_minutes < 0)
        throw ValidationError("waiting_slack_minutes must not be negative");
    if (cfg.cost_scale < 1)
        throw ValidationError("cost_scale must be at least 1");
    if (cfg.fuel_price_per_liter < 0 || cfg.driver_hourly_rate < 0)
        throw ValidationError("prices must not be negative");
    if (!(cfg.weather_multiplier_cap >= 1.0))
        throw ValidationError("weather_multiplier_cap must be at least 1");
    if (!(cfg.traffic_multiplier_limit >= 1.0) || !isfinite(cfg.traffic_multiplier_limit))
        throw ValidationError("traffic_multiplier_limit must be a finite value of at least 1");
    if (cfg.traffic_cache_ttl_seconds < 0 || cfg.route_store_ttl_hours < 0)
        throw ValidationError("cache TTLs must not be negative");
    if (cfg.vehicles.find(cfg.default_vehicle_type) == cfg.vehicles.end())
        throw ValidationError("default_vehicle_type has no specification: " + cfg.default_vehicle_type);
}

OptimizerConfig load_config(const string& path)
{
    OptimizerConfig cfg;
    if (!path.empty()) {
        ifstream fin(path);
        if (!fin) throw ValidationError("could not open config file: " + path);

        json j;
        try {
            fin >> j;
        } catch (const json::exception& e) {
            throw ValidationError(string("error parsing config JSON: ") + e.what());
        }
        cfg = config_from_json(j);
    }
    apply_env_overrides(cfg);
    validate_config(cfg);
    return cfg;
}
