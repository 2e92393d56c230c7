#include "route_assembler.hpp"
#include "errors.hpp"
#include "solver.hpp"
#include <string>
using namespace std;

Route assemble_route(const vector<int>& sequence,
                     const CostMatrix& matrices,
                     const Stop& depot,
                     const vector<Stop>& stops)
{
    int n = matrices.size();
    if (n != (int)stops.size() + 1 || (int)matrices.time_minutes.size() != n)
        throw AssemblyInvariantViolation("matrix size " + to_string(n) + " does not match " +
                                         to_string(stops.size()) + " stops");
    if (!is_depot_permutation(sequence, n))
        throw AssemblyInvariantViolation("sequence of length " + to_string(sequence.size()) +
                                         " is not a depot-first permutation of " + to_string(n) + " nodes");

    Route route;
    route.sequence = sequence;
    route.stops.reserve(n);

    for (int i = 0; i < n; i++) {
        int node = sequence[i];

        RouteStop rs;
        rs.stop = node == 0 ? depot : stops[node - 1];
        rs.node = node;
        rs.sequence = i;

        if (i > 0) {
            int prev = sequence[i - 1];
            rs.distance_from_previous = matrices.distance_km[prev][node];
            rs.time_from_previous = matrices.time_minutes[prev][node];

            route.total_distance_km += rs.distance_from_previous;
            route.total_time_minutes += rs.time_from_previous;
        }
        rs.cumulative_distance_km = route.total_distance_km;
        rs.cumulative_time_minutes = route.total_time_minutes;

        route.stops.push_back(rs);
    }
    return route;
}
