#pragma once
#include "models.hpp"
#include <memory>
#include <vector>

enum class SolveStatus {
    Converged,      // local search found no improving move
    TimedOut,       // deadline hit during local search; incumbent returned
    NonConvergent,  // no feasible construction within the budget
    Fallback        // produced by the greedy nearest-neighbour path
};

const char* solve_status_name(SolveStatus s);

struct SolveInput {
    const CostMatrix& matrices;
    OptimizeFor optimize_for = OptimizeFor::Time;
    Constraints constraints;
    std::vector<double> service_minutes;   // per node, may be empty
    double waiting_slack_minutes = 30.0;   // tolerance on the duration limit
    double time_limit_seconds = 30.0;
    int cost_scale = 100;
};

struct SolveOutcome {
    std::vector<int> sequence;   // empty when NonConvergent
    Quality quality = Quality::Optimal;
    SolveStatus status = SolveStatus::NonConvergent;
    double cost = 0.0;           // open-path cost on the active matrix
};

class RouteSolver {
public:
    virtual ~RouteSolver() = default;
    virtual SolveOutcome solve(const SolveInput& in) const = 0;
    virtual const char* name() const = 0;
};

// Path-cheapest-arc construction honoring capacity and duration, then
// 2-opt / relocate / swap improvement until a local optimum or the deadline.
class SearchRouteSolver : public RouteSolver {
public:
    SolveOutcome solve(const SolveInput& in) const override;
    const char* name() const override { return "search"; }
};

// Nearest neighbour on the distance matrix. Ignores every constraint.
class GreedyRouteSolver : public RouteSolver {
public:
    SolveOutcome solve(const SolveInput& in) const override;
    const char* name() const override { return "greedy"; }
};

enum class SolverStrategy { Search, Greedy };

std::unique_ptr<RouteSolver> make_solver(SolverStrategy strategy);

const Matrix& active_matrix(const CostMatrix& m, OptimizeFor optimize_for);

// Sum of consecutive legs; no return to the depot.
double path_cost(const Matrix& m, const std::vector<int>& sequence);

// Deterministic; ties go to the lowest index.
std::vector<int> nearest_neighbor_sequence(const Matrix& distance);

bool is_depot_permutation(const std::vector<int>& sequence, int n);
