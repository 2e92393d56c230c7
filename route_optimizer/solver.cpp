#include "solver.hpp"
using namespace std;

const char* solve_status_name(SolveStatus s)
{
    switch (s) {
    case SolveStatus::Converged: return "converged";
    case SolveStatus::TimedOut: return "timed_out";
    case SolveStatus::NonConvergent: return "non_convergent";
    case SolveStatus::Fallback: return "fallback";
    }
    return "unknown";
}

const Matrix& active_matrix(const CostMatrix& m, OptimizeFor optimize_for)
{
    return optimize_for == OptimizeFor::Time ? m.time_minutes : m.distance_km;
}

double path_cost(const Matrix& m, const vector<int>& sequence)
{
    if (sequence.size() <= 1) return 0.0;

    double cost = 0.0;
    for (int i = 0; i < (int)sequence.size() - 1; i++) {
        cost += m[sequence[i]][sequence[i + 1]];
    }
    return cost;
}

bool is_depot_permutation(const vector<int>& sequence, int n)
{
    if ((int)sequence.size() != n || n == 0 || sequence[0] != 0) return false;

    vector<bool> seen(n, false);
    for (int v : sequence) {
        if (v < 0 || v >= n || seen[v]) return false;
        seen[v] = true;
    }
    return true;
}

unique_ptr<RouteSolver> make_solver(SolverStrategy strategy)
{
    if (strategy == SolverStrategy::Greedy) return make_unique<GreedyRouteSolver>();
    return make_unique<SearchRouteSolver>();
}
