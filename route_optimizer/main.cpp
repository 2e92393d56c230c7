#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include "config.hpp"
#include "conditions.hpp"
#include "errors.hpp"
#include "json_io.hpp"
#include "log.hpp"
#include "optimizer.hpp"
#include "route_store.hpp"
#include "nlohmann/json.hpp"

using namespace std;
using json = nlohmann::json;

static bool write_json(const string& path, const json& out)
{
    ofstream out_file(path);
    if (!out_file) {
        cerr << "Failed to open output file " << path << "\n";
        return false;
    }
    out_file << out.dump(2) << "\n";
    return true;
}

// "traffic": {"multiplier": 1.3} pins the value, {"hour": 8} uses the
// time-of-day schedule for that hour, absent uses the local clock.
static unique_ptr<TrafficProvider> traffic_from_request(const json& q)
{
    if (q.contains("traffic")) {
        auto& t = q["traffic"];
        if (t.contains("multiplier"))
            return make_unique<FixedTrafficProvider>(t["multiplier"].get<double>());
        if (t.contains("hour")) {
            int hour = t["hour"];
            return make_unique<ScheduleTrafficProvider>([hour] { return hour; });
        }
    }
    return make_unique<ScheduleTrafficProvider>();
}

int main(int argc, char** argv) {
    if (argc < 3 || argc > 4) {
        cerr << "Usage: " << argv[0] << " request.json output.json [config.json]\n";
        return 1;
    }

    try {
        OptimizerConfig cfg = load_config(argc == 4 ? argv[3] : "");
        set_log_level(cfg.log_level);

        ifstream f(argv[1]);
        if (!f) {
            cerr << "Failed to open request file " << argv[1] << "\n";
            return 1;
        }

        json q;
        try {
            f >> q;
        } catch (const exception& e) {
            cerr << "Error parsing request JSON: " << e.what() << "\n";
            return 1;
        }

        OptimizeRequest req;
        unique_ptr<TrafficProvider> traffic;
        unique_ptr<WeatherProvider> weather;
        try {
            req = request_from_json(q);
            traffic = traffic_from_request(q);
            if (q.contains("weather"))
                weather = make_unique<FixedWeatherProvider>(weather_from_json(q["weather"]), cfg.weather_multiplier_cap);
        } catch (const ValidationError& e) {
            cerr << "Invalid request: " << e.what() << "\n";
            write_json(argv[2], json{{"error", e.what()}});
            return 1;
        } catch (const json::exception& e) {
            cerr << "Invalid request: " << e.what() << "\n";
            write_json(argv[2], json{{"error", e.what()}});
            return 1;
        }

        cout << "Loaded request with " << req.destinations.size() << " destinations\n";

        TtlCache<double> traffic_cache;
        CachingTrafficProvider cached_traffic(*traffic, traffic_cache,
                                              chrono::seconds(cfg.traffic_cache_ttl_seconds));
        RouteStore store(chrono::hours(cfg.route_store_ttl_hours));
        RouteOptimizer optimizer(cfg, &cached_traffic, weather.get());

        auto start_time = chrono::steady_clock::now();

        OptimizationResult result;
        try {
            result = optimizer.optimize(req);
        } catch (const ValidationError& e) {
            cerr << "Invalid request: " << e.what() << "\n";
            write_json(argv[2], json{{"error", e.what()}});
            return 1;
        }

        auto end_time = chrono::steady_clock::now();
        auto duration = chrono::duration_cast<chrono::milliseconds>(end_time - start_time);

        store.save(result.route_id, result);

        cout << "Optimization completed in " << duration.count() << " ms\n";
        cout << "Route " << result.route_id << ": " << result.metrics.total_distance_km << " km, "
             << result.metrics.total_time_minutes << " min, quality "
             << quality_name(result.metrics.quality) << "\n";

        if (!write_json(argv[2], result_to_json(result))) return 1;
        cout << "Output written to " << argv[2] << "\n";
    }
    catch (const exception& e) {
        cerr << "EXCEPTION | " << e.what() << "\n";
        return 1;
    }
    return 0;
}
