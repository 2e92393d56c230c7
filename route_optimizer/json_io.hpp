#pragma once
#include "conditions.hpp"
#include "models.hpp"
#include "nlohmann/json.hpp"

// Throws ValidationError on missing or malformed fields.
OptimizeRequest request_from_json(const nlohmann::json& j);
WeatherReading weather_from_json(const nlohmann::json& j);

nlohmann::json route_to_json(const Route& route);
nlohmann::json metrics_to_json(const RouteMetrics& m);
nlohmann::json result_to_json(const OptimizationResult& r);
