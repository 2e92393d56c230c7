#pragma once
#include "conditions.hpp"
#include "config.hpp"
#include "models.hpp"
#include "solver.hpp"
#include <memory>
#include <string>

// Per-call lifecycle. SOLVING goes to FALLBACK instead of SOLVED when no
// feasible construction exists.
enum class OptimizeStage { Init, MatrixBuilt, Solving, Solved, Fallback, Assembled, MetricsComputed, Done };

const char* stage_name(OptimizeStage s);

// Throws ValidationError.
void validate_request(const OptimizeRequest& req, int max_stops);

std::string generate_route_id();
std::string utc_timestamp();

// Stateless between calls; optimize() may run concurrently on one instance
// as long as the providers are themselves thread-safe.
class RouteOptimizer {
public:
    RouteOptimizer(OptimizerConfig config, const TrafficProvider* traffic, const WeatherProvider* weather);

    OptimizationResult optimize(const OptimizeRequest& req) const;

    const OptimizerConfig& config() const { return cfg; }

private:
    OptimizerConfig cfg;
    const TrafficProvider* traffic;
    const WeatherProvider* weather;
    std::unique_ptr<RouteSolver> solver;
    GreedyRouteSolver fallback;
};
