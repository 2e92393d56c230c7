#include "conditions.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <algorithm>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>
using namespace std;

double weather_impact(const WeatherReading& w, double cap)
{
    double multiplier = 1.0;

    if (w.precipitation_mm > 0)
        multiplier += 0.1 + (w.precipitation_mm / 10.0) * 0.2;

    if (w.wind_speed_kmh > 20)
        multiplier += (w.wind_speed_kmh - 20) / 100.0;

    if (w.visibility_km < 5)
        multiplier += (5 - w.visibility_km) / 10.0;

    return min(multiplier, cap);
}

double traffic_multiplier_for_hour(int hour)
{
    if ((hour >= 7 && hour <= 9) || (hour >= 17 && hour <= 19)) return 1.4;
    if (hour >= 10 && hour <= 16) return 1.1;
    return 1.0;
}

static int local_hour_now()
{
    time_t t = time(nullptr);
    tm local{};
    localtime_r(&t, &local);
    return local.tm_hour;
}

ScheduleTrafficProvider::ScheduleTrafficProvider() : hour_fn(local_hour_now) {}

double ScheduleTrafficProvider::get_multiplier(const Location&, const vector<Stop>&) const
{
    int hour = hour_fn();
    if (hour < 0 || hour > 23)
        throw CollaboratorUnavailable("traffic schedule hour out of range: " + to_string(hour));
    return traffic_multiplier_for_hour(hour);
}

string conditions_cache_key(const string& prefix, const Location& origin, const vector<Stop>& destinations)
{
    ostringstream key;
    key << prefix << fixed << setprecision(6) << origin.lat << "," << origin.lng;
    for (auto& s : destinations)
        key << ";" << s.location.lat << "," << s.location.lng;
    return key.str();
}

double CachingTrafficProvider::get_multiplier(const Location& origin, const vector<Stop>& destinations) const
{
    string key = conditions_cache_key("traffic_", origin, destinations);
    if (auto hit = cache.get(key)) return *hit;

    double m = inner.get_multiplier(origin, destinations);
    cache.set(key, m, ttl);
    return m;
}

template <typename Fn>
static bool fetch_multiplier(const char* what, Fn fetch, double limit, double& out)
{
    try {
        double m = fetch();
        if (!isfinite(m) || m <= 0 || m > limit) {
            log_warn(string(what) + " multiplier " + to_string(m) + " is not usable, degraded mode (1.0)");
            return false;
        }
        out = m;
        return true;
    } catch (const exception& e) {
        log_warn(string("failed to get ") + what + " data: " + e.what() + ", degraded mode (1.0)");
        return false;
    }
}

ResolvedConditions resolve_conditions(const TrafficProvider* traffic,
                                      const WeatherProvider* weather,
                                      const Location& origin,
                                      const vector<Stop>& destinations,
                                      const Preferences& prefs,
                                      double weather_cap,
                                      double traffic_limit)
{
    ResolvedConditions rc;

    if (prefs.consider_traffic) {
        if (!traffic) {
            log_warn("no traffic provider configured, degraded mode (1.0)");
            rc.traffic_degraded = true;
        } else if (!fetch_multiplier("traffic", [&] { return traffic->get_multiplier(origin, destinations); },
                                     traffic_limit, rc.traffic_multiplier)) {
            rc.traffic_multiplier = 1.0;
            rc.traffic_degraded = true;
        }
    }

    if (prefs.consider_weather) {
        if (!weather) {
            log_warn("no weather provider configured, degraded mode (1.0)");
            rc.weather_degraded = true;
        } else if (!fetch_multiplier("weather", [&] { return weather->get_impact_multiplier(origin, destinations); },
                                     numeric_limits<double>::max(), rc.weather_multiplier)) {
            rc.weather_multiplier = 1.0;
            rc.weather_degraded = true;
        }
        rc.weather_multiplier = min(rc.weather_multiplier, weather_cap);
    }

    return rc;
}
