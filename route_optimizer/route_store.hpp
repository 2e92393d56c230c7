#pragma once
#include "models.hpp"
#include "ttl_cache.hpp"
#include "nlohmann/json.hpp"
#include <chrono>
#include <optional>
#include <string>

// Keeps serialized results for callers after an optimize call is done.
class RouteStore {
public:
    explicit RouteStore(std::chrono::hours ttl = std::chrono::hours(24)) : ttl(ttl) {}
    RouteStore(std::chrono::hours ttl, TtlCache<nlohmann::json>::NowFn now) : ttl(ttl), cache(std::move(now)) {}

    void save(const std::string& route_id, const OptimizationResult& result);
    std::optional<nlohmann::json> load(const std::string& route_id);
    std::size_t size() const { return cache.size(); }

private:
    std::chrono::hours ttl;
    TtlCache<nlohmann::json> cache;
};
