#include "vehicles.hpp"
#include "errors.hpp"
#include "log.hpp"
using namespace std;

const VehicleTable& default_vehicle_specs()
{
    static const VehicleTable table = {
        {"diesel_truck",   {"diesel_truck",   "diesel",   35.0, 0.85, 0.162}},
        {"petrol_truck",   {"petrol_truck",   "petrol",   40.0, 0.95, 0.184}},
        {"electric_truck", {"electric_truck", "electric",  0.0, 0.45, 0.045}},
        {"hybrid_truck",   {"hybrid_truck",   "hybrid",   25.0, 0.70, 0.098}},
    };
    return table;
}

VehicleSpec lookup_vehicle(const VehicleTable& table,
                           const string& vehicle_type,
                           const string& fallback_type)
{
    auto it = table.find(vehicle_type);
    if (it != table.end()) return it->second;

    auto fb = table.find(fallback_type);
    if (fb == table.end())
        throw OptimizationError("no vehicle specification for fallback type " + fallback_type);

    log_warn("unknown vehicle type '" + vehicle_type + "', using " + fallback_type);
    return fb->second;
}
