#pragma once
#include "models.hpp"
#include <string>
#include <unordered_map>

using VehicleTable = std::unordered_map<std::string, VehicleSpec>;

// Built once, read-only afterwards.
const VehicleTable& default_vehicle_specs();

// Unknown types resolve to fallback_type.
VehicleSpec lookup_vehicle(const VehicleTable& table,
                           const std::string& vehicle_type,
                           const std::string& fallback_type);
