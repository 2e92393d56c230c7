#include "optimizer.hpp"
#include "errors.hpp"
#include "geo.hpp"
#include "log.hpp"
#include "matrix_builder.hpp"
#include "metrics.hpp"
#include "route_assembler.hpp"
#include "vehicles.hpp"
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <random>
using namespace std;

const char* stage_name(OptimizeStage s)
{
    switch (s) {
    case OptimizeStage::Init: return "INIT";
    case OptimizeStage::MatrixBuilt: return "MATRIX_BUILT";
    case OptimizeStage::Solving: return "SOLVING";
    case OptimizeStage::Solved: return "SOLVED";
    case OptimizeStage::Fallback: return "FALLBACK";
    case OptimizeStage::Assembled: return "ASSEMBLED";
    case OptimizeStage::MetricsComputed: return "METRICS_COMPUTED";
    case OptimizeStage::Done: return "DONE";
    }
    return "UNKNOWN";
}

void validate_request(const OptimizeRequest& req, int max_stops)
{
    if (!is_valid_location(req.origin))
        throw ValidationError("origin coordinates are invalid");
    if (req.destinations.empty())
        throw ValidationError("destinations must not be empty");
    if ((int)req.destinations.size() > max_stops)
        throw ValidationError("too many destinations: " + to_string(req.destinations.size()) +
                              " (max " + to_string(max_stops) + ")");

    for (size_t i = 0; i < req.destinations.size(); i++) {
        auto& s = req.destinations[i];
        if (!is_valid_location(s.location))
            throw ValidationError("destination " + to_string(i) + " has invalid coordinates");
        if (s.service_time_minutes && !(*s.service_time_minutes >= 0))
            throw ValidationError("destination " + to_string(i) + " has a negative service time");
    }

    if (req.constraints.max_capacity && *req.constraints.max_capacity <= 0)
        throw ValidationError("max_capacity must be positive");
    if (req.constraints.max_duration_minutes && *req.constraints.max_duration_minutes <= 0)
        throw ValidationError("max_duration_minutes must be positive");
    if (req.time_limit_seconds && !(*req.time_limit_seconds > 0))
        throw ValidationError("time limit must be positive");
}

string generate_route_id()
{
    thread_local mt19937_64 rng{random_device{}()};
    uint64_t hi = rng(), lo = rng();

    // RFC 4122 version 4, variant 1.
    hi = (hi & 0xffffffffffff0fffULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3fffffffffffffffULL) | 0x8000000000000000ULL;

    char buf[37];
    snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
             (unsigned)(hi >> 32), (unsigned)((hi >> 16) & 0xffff), (unsigned)(hi & 0xffff),
             (unsigned)(lo >> 48), (unsigned long long)(lo & 0xffffffffffffULL));
    return buf;
}

string utc_timestamp()
{
    time_t t = time(nullptr);
    tm utc{};
    gmtime_r(&t, &utc);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buf;
}

RouteOptimizer::RouteOptimizer(OptimizerConfig config, const TrafficProvider* traffic, const WeatherProvider* weather)
    : cfg(move(config)), traffic(traffic), weather(weather), solver(make_solver(cfg.solver))
{
    validate_config(cfg);
}

OptimizationResult RouteOptimizer::optimize(const OptimizeRequest& req) const
{
    string route_id = generate_route_id();
    log_info("starting route optimization: " + route_id);

    OptimizeStage stage = OptimizeStage::Init;
    auto advance = [&](OptimizeStage next) {
        log_debug(route_id + ": " + stage_name(stage) + " -> " + stage_name(next));
        stage = next;
    };

    validate_request(req, cfg.max_stops_per_route);

    ResolvedConditions rc = resolve_conditions(traffic, weather, req.origin, req.destinations,
                                               req.preferences, cfg.weather_multiplier_cap,
                                               cfg.traffic_multiplier_limit);
    CostMatrix matrices = build_matrices(req.origin, req.destinations, rc.traffic_multiplier,
                                         rc.weather_multiplier, cfg.assumed_speed_kmh);
    advance(OptimizeStage::MatrixBuilt);

    SolveInput in{matrices};
    in.optimize_for = req.preferences.optimize_for;
    in.constraints = req.constraints;
    in.waiting_slack_minutes = cfg.waiting_slack_minutes;
    in.time_limit_seconds = req.time_limit_seconds.value_or(cfg.optimization_timeout_seconds);
    in.cost_scale = cfg.cost_scale;
    in.service_minutes.assign(matrices.size(), 0.0);
    for (size_t i = 0; i < req.destinations.size(); i++)
        in.service_minutes[i + 1] = req.destinations[i].service_time_minutes.value_or(0.0);

    advance(OptimizeStage::Solving);
    SolveOutcome outcome;
    try {
        outcome = solver->solve(in);
    } catch (const exception& e) {
        log_error(route_id + ": " + solver->name() + " solver failed: " + e.what());
        outcome = SolveOutcome{};
    }

    if (outcome.status == SolveStatus::NonConvergent) {
        advance(OptimizeStage::Fallback);
        log_warn(route_id + ": solver did not converge, using nearest neighbour");
        outcome = fallback.solve(in);
    } else if (outcome.quality == Quality::HeuristicFallback) {
        advance(OptimizeStage::Fallback);
    } else {
        advance(OptimizeStage::Solved);
    }

    Stop depot{req.origin, "depot", 1, nullopt};
    Route route;
    try {
        route = assemble_route(outcome.sequence, matrices, depot, req.destinations);
    } catch (const exception& e) {
        log_error(route_id + ": route optimization failed: " + e.what());
        throw;
    }
    advance(OptimizeStage::Assembled);

    string vehicle_type = req.vehicle_type.empty() ? cfg.default_vehicle_type : req.vehicle_type;
    VehicleSpec vehicle = lookup_vehicle(cfg.vehicles, vehicle_type, cfg.default_vehicle_type);

    RouteMetrics metrics = compute_metrics(route, vehicle, CostRates{cfg.fuel_price_per_liter, cfg.driver_hourly_rate});
    metrics.quality = outcome.quality;
    metrics.search_converged = outcome.status == SolveStatus::Converged;
    metrics.traffic_impact = rc.traffic_multiplier;
    metrics.weather_impact = rc.weather_multiplier;
    metrics.traffic_degraded = rc.traffic_degraded;
    metrics.weather_degraded = rc.weather_degraded;
    advance(OptimizeStage::MetricsComputed);

    OptimizationResult result;
    result.route_id = route_id;
    result.timestamp = utc_timestamp();
    result.optimized_route = move(route);
    result.metrics = metrics;
    advance(OptimizeStage::Done);

    log_info("route optimization completed: " + route_id + " (" + quality_name(metrics.quality) + ", " +
             solve_status_name(outcome.status) + ", " + to_string(metrics.total_distance_km) + " km)");
    return result;
}
