#include "route_store.hpp"
#include "json_io.hpp"
#include "log.hpp"
using namespace std;

void RouteStore::save(const string& route_id, const OptimizationResult& result)
{
    size_t dropped = cache.purge_expired();
    if (dropped) log_debug(to_string(dropped) + " expired routes dropped");
    cache.set(route_id, result_to_json(result), chrono::duration_cast<chrono::seconds>(ttl));
    log_info("route " + route_id + " cached, " + to_string(size()) + " stored");
}

optional<nlohmann::json> RouteStore::load(const string& route_id)
{
    auto hit = cache.get(route_id);
    if (!hit) log_info("route " + route_id + " not found in cache");
    return hit;
}
