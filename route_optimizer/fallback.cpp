#include "solver.hpp"
using namespace std;

vector<int> nearest_neighbor_sequence(const Matrix& distance)
{
    int n = distance.size();
    if (n == 0) return {};

    vector<int> route = {0};
    vector<bool> visited(n, false);
    visited[0] = true;
    int current = 0;

    for (int step = 1; step < n; step++) {
        int best_node = -1;
        double best = 0.0;

        // Strict comparison keeps the lowest index on ties.
        for (int j = 1; j < n; j++) {
            if (visited[j]) continue;
            if (best_node == -1 || distance[current][j] < best) {
                best = distance[current][j];
                best_node = j;
            }
        }

        route.push_back(best_node);
        visited[best_node] = true;
        current = best_node;
    }
    return route;
}

SolveOutcome GreedyRouteSolver::solve(const SolveInput& in) const
{
    SolveOutcome out;
    out.sequence = nearest_neighbor_sequence(in.matrices.distance_km);
    out.quality = Quality::HeuristicFallback;
    out.status = SolveStatus::Fallback;
    out.cost = path_cost(active_matrix(in.matrices, in.optimize_for), out.sequence);
    return out;
}
