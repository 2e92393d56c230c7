#include "matrix_builder.hpp"
#include "geo.hpp"
using namespace std;

vector<Location> route_points(const Location& depot, const vector<Stop>& stops)
{
    vector<Location> points;
    points.reserve(stops.size() + 1);
    points.push_back(depot);
    for (auto& s : stops) points.push_back(s.location);
    return points;
}

CostMatrix build_matrices(const Location& depot,
                          const vector<Stop>& stops,
                          double traffic_multiplier,
                          double weather_multiplier,
                          double assumed_speed_kmh)
{
    auto points = route_points(depot, stops);
    int n = points.size();

    CostMatrix m;
    m.distance_km.assign(n, vector<double>(n, 0.0));
    m.time_minutes.assign(n, vector<double>(n, 0.0));

    double factor = traffic_multiplier * weather_multiplier;

    // Distance is symmetric, so fill both triangles from one evaluation.
    for (int i = 0; i < n; i++) {
        for (int j = i + 1; j < n; j++) {
            double dist = haversine_km(points[i], points[j]);
            double base_time = dist / assumed_speed_kmh * 60.0;

            m.distance_km[i][j] = m.distance_km[j][i] = dist;
            m.time_minutes[i][j] = m.time_minutes[j][i] = base_time * factor;
        }
    }
    return m;
}
