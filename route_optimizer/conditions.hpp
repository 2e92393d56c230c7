#pragma once
#include "models.hpp"
#include "ttl_cache.hpp"
#include <chrono>
#include <functional>
#include <string>
#include <vector>

struct WeatherReading {
    std::string condition = "clear";
    double temperature_c = 20.0;
    double precipitation_mm = 0.0;
    double wind_speed_kmh = 10.0;
    double visibility_km = 15.0;
};

// Travel-time multiplier for a weather reading, capped at cap.
double weather_impact(const WeatherReading& w, double cap);

// Rush hours 7-9 and 17-19 give 1.4, daytime 10-16 gives 1.1, else 1.0.
double traffic_multiplier_for_hour(int hour);

class TrafficProvider {
public:
    virtual ~TrafficProvider() = default;
    // Throws CollaboratorUnavailable (or anything else) when no data exists.
    virtual double get_multiplier(const Location& origin,
                                  const std::vector<Stop>& destinations) const = 0;
};

class WeatherProvider {
public:
    virtual ~WeatherProvider() = default;
    virtual double get_impact_multiplier(const Location& origin,
                                         const std::vector<Stop>& destinations) const = 0;
};

class FixedTrafficProvider : public TrafficProvider {
public:
    explicit FixedTrafficProvider(double multiplier) : multiplier(multiplier) {}
    double get_multiplier(const Location&, const std::vector<Stop>&) const override { return multiplier; }

private:
    double multiplier;
};

class ScheduleTrafficProvider : public TrafficProvider {
public:
    using HourFn = std::function<int()>;

    // Default hour source is the local wall clock.
    ScheduleTrafficProvider();
    explicit ScheduleTrafficProvider(HourFn hour_fn) : hour_fn(std::move(hour_fn)) {}

    double get_multiplier(const Location& origin, const std::vector<Stop>& destinations) const override;

private:
    HourFn hour_fn;
};

class CachingTrafficProvider : public TrafficProvider {
public:
    CachingTrafficProvider(const TrafficProvider& inner, TtlCache<double>& cache, std::chrono::seconds ttl)
        : inner(inner), cache(cache), ttl(ttl) {}

    double get_multiplier(const Location& origin, const std::vector<Stop>& destinations) const override;

private:
    const TrafficProvider& inner;
    TtlCache<double>& cache;
    std::chrono::seconds ttl;
};

class FixedWeatherProvider : public WeatherProvider {
public:
    FixedWeatherProvider(WeatherReading reading, double cap) : reading(std::move(reading)), cap(cap) {}
    double get_impact_multiplier(const Location&, const std::vector<Stop>&) const override
    {
        return weather_impact(reading, cap);
    }

private:
    WeatherReading reading;
    double cap;
};

std::string conditions_cache_key(const std::string& prefix, const Location& origin,
                                 const std::vector<Stop>& destinations);

struct ResolvedConditions {
    double traffic_multiplier = 1.0;
    double weather_multiplier = 1.0;
    bool traffic_degraded = false;
    bool weather_degraded = false;
};

// Never throws. A null, failing or nonsensical provider yields 1.0 and
// marks that collaborator degraded. Traffic above traffic_limit counts as
// nonsensical; weather above weather_cap is clamped to it.
ResolvedConditions resolve_conditions(const TrafficProvider* traffic,
                                      const WeatherProvider* weather,
                                      const Location& origin,
                                      const std::vector<Stop>& destinations,
                                      const Preferences& prefs,
                                      double weather_cap,
                                      double traffic_limit);
