#include "solver.hpp"
#include "log.hpp"
#include "timer.hpp"
#include <algorithm>
#include <optional>
#include <string>
using namespace std;

using IntMatrix = vector<vector<long long>>;

// Upper bound for one scaled arc. Keeps every path sum far below LLONG_MAX.
static const long long MAX_SCALED_ARC = 1000000000000LL;

static long long scale_value(double v, int scale)
{
    double scaled = v * scale;
    if (!(scaled < (double)MAX_SCALED_ARC)) return MAX_SCALED_ARC;
    return (long long)scaled;
}

// Integer costs keep comparisons inside the search exact and repeatable.
static IntMatrix scale_matrix(const Matrix& m, int scale)
{
    int n = m.size();
    IntMatrix out(n, vector<long long>(n, 0));
    for (int i = 0; i < n; i++)
        for (int j = 0; j < n; j++)
            out[i][j] = scale_value(m[i][j], scale);
    return out;
}

static long long scaled_cost(const IntMatrix& cost, const vector<int>& route)
{
    long long total = 0;
    for (int i = 0; i + 1 < (int)route.size(); i++)
        total += cost[route[i]][route[i + 1]];
    return total;
}

// Duration is checked in plain minutes so truncation never admits an
// overshoot. The waiting slack is one tolerance on top of the route limit.
struct RouteDimensions {
    optional<int> capacity;
    optional<double> duration_limit;
    const Matrix* transit = nullptr;
    vector<double> service;
};

static RouteDimensions make_dimensions(const SolveInput& in, int n)
{
    RouteDimensions dims;
    dims.capacity = in.constraints.max_capacity;
    if (in.constraints.max_duration_minutes)
        dims.duration_limit = *in.constraints.max_duration_minutes + in.waiting_slack_minutes;

    dims.transit = &in.matrices.time_minutes;
    dims.service.assign(n, 0.0);
    for (int i = 1; i < n && i < (int)in.service_minutes.size(); i++)
        dims.service[i] = in.service_minutes[i];
    return dims;
}

static double arrival_after(const RouteDimensions& dims, double elapsed, int from, int to)
{
    return elapsed + (*dims.transit)[from][to] + dims.service[to];
}

static bool is_feasible(const vector<int>& route, const RouteDimensions& dims)
{
    // Load grows by one unit per stop, so the full route carries the peak.
    if (dims.capacity && (int)route.size() - 1 > *dims.capacity) return false;
    if (!dims.duration_limit) return true;

    double elapsed = 0;
    for (int k = 1; k < (int)route.size(); k++) {
        elapsed = arrival_after(dims, elapsed, route[k - 1], route[k]);
        if (!(elapsed <= *dims.duration_limit)) return false;
    }
    return true;
}

// Path cheapest arc: extend from the last node with the cheapest arc whose
// target keeps every dimension within bounds.
static bool construct_initial_route(const IntMatrix& cost,
                                    const RouteDimensions& dims,
                                    const SearchTimer& timer,
                                    vector<int>& route)
{
    int n = cost.size();
    vector<bool> visited(n, false);
    visited[0] = true;
    route = {0};

    int current = 0;
    int load = 0;
    double elapsed = 0;
    vector<int> candidates;

    while ((int)route.size() < n) {
        if (timer.check_time_limit()) return false;

        candidates.clear();
        for (int j = 1; j < n; j++)
            if (!visited[j]) candidates.push_back(j);

        // Candidates are ascending, so a stable sort breaks ties by index.
        stable_sort(candidates.begin(), candidates.end(),
                    [&](int a, int b) { return cost[current][a] < cost[current][b]; });

        int chosen = -1;
        for (int j : candidates) {
            if (dims.capacity && load + 1 > *dims.capacity) break;
            if (dims.duration_limit && !(arrival_after(dims, elapsed, current, j) <= *dims.duration_limit))
                continue;
            chosen = j;
            break;
        }
        if (chosen == -1) return false;

        elapsed = arrival_after(dims, elapsed, current, chosen);
        load++;
        visited[chosen] = true;
        route.push_back(chosen);
        current = chosen;
    }
    return true;
}

namespace {

class LocalSearch {
public:
    LocalSearch(const IntMatrix& cost, const RouteDimensions& dims, const SearchTimer& timer)
        : cost(cost), dims(dims), timer(timer) {}

    // True when no improving move is left; false when the deadline cut
    // the search short. route always stays feasible.
    bool run(vector<int>& route)
    {
        long long current = scaled_cost(cost, route);
        int moves = 0;

        while (!out_of_time) {
            if (two_opt(route, current) || relocate(route, current) || swap_stops(route, current)) {
                moves++;
                continue;
            }
            if (!out_of_time) {
                log_debug("local search converged after " + to_string(moves) + " moves");
                return true;
            }
        }
        log_debug("local search stopped by deadline after " + to_string(moves) + " moves");
        return false;
    }

private:
    bool deadline_hit()
    {
        if (!out_of_time && timer.check_time_limit()) out_of_time = true;
        return out_of_time;
    }

    bool accept(vector<int>& route, const vector<int>& candidate, long long& current)
    {
        long long c = scaled_cost(cost, candidate);
        if (c >= current || !is_feasible(candidate, dims)) return false;
        route = candidate;
        current = c;
        return true;
    }

    // Reverse route[i..j].
    bool two_opt(vector<int>& route, long long& current)
    {
        int n = route.size();
        for (int i = 1; i < n - 1; i++) {
            for (int j = i + 1; j < n; j++) {
                if (deadline_hit()) return false;
                candidate = route;
                reverse(candidate.begin() + i, candidate.begin() + j + 1);
                if (accept(route, candidate, current)) return true;
            }
        }
        return false;
    }

    // Move the stop at position i to position p.
    bool relocate(vector<int>& route, long long& current)
    {
        int n = route.size();
        for (int i = 1; i < n; i++) {
            for (int p = 1; p < n; p++) {
                if (p == i || p == i - 1) continue;
                if (deadline_hit()) return false;
                candidate = route;
                int node = candidate[i];
                candidate.erase(candidate.begin() + i);
                candidate.insert(candidate.begin() + p, node);
                if (accept(route, candidate, current)) return true;
            }
        }
        return false;
    }

    // Exchange two non-adjacent stops; adjacent pairs are covered by two_opt.
    bool swap_stops(vector<int>& route, long long& current)
    {
        int n = route.size();
        for (int i = 1; i < n; i++) {
            for (int j = i + 2; j < n; j++) {
                if (deadline_hit()) return false;
                candidate = route;
                std::swap(candidate[i], candidate[j]);
                if (accept(route, candidate, current)) return true;
            }
        }
        return false;
    }

    const IntMatrix& cost;
    const RouteDimensions& dims;
    const SearchTimer& timer;
    vector<int> candidate;
    bool out_of_time = false;
};

}  // namespace

SolveOutcome SearchRouteSolver::solve(const SolveInput& in) const
{
    SearchTimer timer(in.time_limit_seconds);
    SolveOutcome out;
    out.status = SolveStatus::NonConvergent;

    int n = in.matrices.size();
    if (n < 2) {
        log_debug("no destinations to route, construction impossible");
        return out;
    }

    const Matrix& active = active_matrix(in.matrices, in.optimize_for);
    IntMatrix cost = scale_matrix(active, in.cost_scale);
    RouteDimensions dims = make_dimensions(in, n);

    if (dims.capacity && n - 1 > *dims.capacity) {
        log_warn("capacity " + to_string(*dims.capacity) + " cannot serve " +
                 to_string(n - 1) + " stops on one vehicle");
        return out;
    }

    vector<int> route;
    if (!construct_initial_route(cost, dims, timer, route)) {
        if (timer.check_time_limit())
            log_warn("deadline reached before an initial route was built");
        else
            log_warn("no feasible initial route within the duration limit");
        return out;
    }

    LocalSearch ls(cost, dims, timer);
    bool converged = ls.run(route);

    // Truncated costs can hide small differences; never return worse than
    // the greedy tour when that tour is feasible.
    vector<int> greedy = nearest_neighbor_sequence(in.matrices.distance_km);
    if (is_feasible(greedy, dims) && path_cost(active, greedy) < path_cost(active, route))
        route = greedy;

    out.sequence = route;
    out.quality = Quality::Optimal;
    out.status = converged ? SolveStatus::Converged : SolveStatus::TimedOut;
    out.cost = path_cost(active, route);
    return out;
}
