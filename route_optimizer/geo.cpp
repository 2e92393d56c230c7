#include "geo.hpp"
#include <cmath>
using namespace std;

static const double EARTH_RADIUS_KM = 6371.0;

static double to_radians(double deg)
{
    static const double PI = acos(-1.0);
    return deg * PI / 180.0;
}

double haversine_km(const Location& a, const Location& b)
{
    double dlat = to_radians(b.lat - a.lat);
    double dlon = to_radians(b.lng - a.lng);

    double h = sin(dlat / 2) * sin(dlat / 2) +
               cos(to_radians(a.lat)) * cos(to_radians(b.lat)) *
               sin(dlon / 2) * sin(dlon / 2);

    return EARTH_RADIUS_KM * 2 * asin(sqrt(h));
}

bool is_valid_location(const Location& p)
{
    if (!isfinite(p.lat) || !isfinite(p.lng)) return false;
    return p.lat >= -90.0 && p.lat <= 90.0 && p.lng >= -180.0 && p.lng <= 180.0;
}
