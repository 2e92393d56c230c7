#include "json_io.hpp"
#include "errors.hpp"
#include <string>
using namespace std;
using json = nlohmann::json;

static Location location_from_json(const json& j, const string& what)
{
    if (!j.is_object() || !j.contains("lat") || !j.contains("lng"))
        throw ValidationError(what + " must be an object with lat and lng");
    if (!j["lat"].is_number() || !j["lng"].is_number())
        throw ValidationError(what + " coordinates must be numbers");

    return Location{j["lat"].get<double>(), j["lng"].get<double>()};
}

static OptimizeFor optimize_for_from_string(const string& name)
{
    if (name == "time") return OptimizeFor::Time;
    // Fuel and emissions both scale with distance for a single vehicle.
    if (name == "distance" || name == "fuel" || name == "emissions") return OptimizeFor::Distance;
    throw ValidationError("unknown optimize_for: " + name);
}

OptimizeRequest request_from_json(const json& j)
{
    if (!j.is_object() || !j.contains("origin") || !j.contains("destinations"))
        throw ValidationError("Missing required fields: origin, destinations");
    if (!j["destinations"].is_array())
        throw ValidationError("destinations must be an array");

    OptimizeRequest req;
    try {
        req.origin = location_from_json(j["origin"], "origin");

        int idx = 0;
        for (auto& d : j["destinations"]) {
            idx++;
            Stop s;
            s.location = location_from_json(d, "destination " + to_string(idx));
            s.id = d.value("id", "stop_" + to_string(idx));
            s.priority = d.value("priority", 1);
            if (d.contains("service_time_minutes"))
                s.service_time_minutes = d["service_time_minutes"].get<double>();
            req.destinations.push_back(s);
        }

        req.vehicle_type = j.value("vehicle_type", "");

        if (j.contains("constraints") && !j["constraints"].is_null()) {
            auto& c = j["constraints"];
            if (c.contains("max_capacity"))
                req.constraints.max_capacity = c["max_capacity"].get<int>();
            if (c.contains("max_duration_minutes"))
                req.constraints.max_duration_minutes = c["max_duration_minutes"].get<int>();
            else if (c.contains("max_duration"))
                req.constraints.max_duration_minutes = c["max_duration"].get<int>();
        }

        if (j.contains("preferences") && !j["preferences"].is_null()) {
            auto& p = j["preferences"];
            Preferences& prefs = req.preferences;
            prefs.optimize_for = optimize_for_from_string(p.value("optimize_for", "time"));
            prefs.avoid_tolls = p.value("avoid_tolls", prefs.avoid_tolls);
            prefs.avoid_highways = p.value("avoid_highways", prefs.avoid_highways);
            prefs.prefer_main_roads = p.value("prefer_main_roads", prefs.prefer_main_roads);
            prefs.consider_traffic = p.value("consider_traffic", prefs.consider_traffic);
            prefs.consider_weather = p.value("consider_weather", prefs.consider_weather);
        }

        if (j.contains("time_limit_ms"))
            req.time_limit_seconds = j["time_limit_ms"].get<double>() / 1000.0;
    } catch (const json::exception& e) {
        throw ValidationError(string("malformed request: ") + e.what());
    }
    return req;
}

WeatherReading weather_from_json(const json& j)
{
    WeatherReading w;
    try {
        w.condition = j.value("condition", w.condition);
        w.temperature_c = j.value("temperature", w.temperature_c);
        w.precipitation_mm = j.value("precipitation", w.precipitation_mm);
        w.wind_speed_kmh = j.value("wind_speed", w.wind_speed_kmh);
        w.visibility_km = j.value("visibility", w.visibility_km);
    } catch (const json::exception& e) {
        throw ValidationError(string("malformed weather reading: ") + e.what());
    }
    return w;
}

json route_to_json(const Route& route)
{
    json stops = json::array();
    for (auto& rs : route.stops) {
        json s;
        s["lat"] = rs.stop.location.lat;
        s["lng"] = rs.stop.location.lng;
        s["id"] = rs.stop.id;
        s["stop_id"] = rs.node;
        s["priority"] = rs.stop.priority;
        s["sequence"] = rs.sequence;
        if (rs.stop.service_time_minutes)
            s["service_time_minutes"] = *rs.stop.service_time_minutes;
        if (rs.sequence > 0) {
            s["distance_from_previous"] = rs.distance_from_previous;
            s["time_from_previous"] = rs.time_from_previous;
        }
        s["cumulative_distance_km"] = rs.cumulative_distance_km;
        s["cumulative_time_minutes"] = rs.cumulative_time_minutes;
        stops.push_back(s);
    }

    json out;
    out["stops"] = stops;
    out["total_distance_km"] = route.total_distance_km;
    out["total_time_minutes"] = route.total_time_minutes;
    out["optimization_sequence"] = route.sequence;
    return out;
}

json metrics_to_json(const RouteMetrics& m)
{
    return {
        {"total_distance_km", m.total_distance_km},
        {"total_time_minutes", m.total_time_minutes},
        {"fuel_consumed_liters", m.fuel_consumed_liters},
        {"estimated_cost_usd", m.estimated_cost_usd},
        {"average_speed_kmh", m.average_speed_kmh},
        {"traffic_impact", m.traffic_impact},
        {"weather_impact", m.weather_impact},
        {"traffic_degraded", m.traffic_degraded},
        {"weather_degraded", m.weather_degraded},
        {"optimization_quality", quality_name(m.quality)},
        {"search_converged", m.search_converged},
        {"stops_count", m.stops_count},
        {"vehicle_type", m.vehicle_type}
    };
}

json result_to_json(const OptimizationResult& r)
{
    json out;
    out["route_id"] = r.route_id;
    out["optimized_route"] = route_to_json(r.optimized_route);
    out["metrics"] = metrics_to_json(r.metrics);
    out["timestamp"] = r.timestamp;
    return out;
}
