#include "model/run_stats.hpp"

int laneTotal(const RunStats& stats, int lane) {
    if (!isValidLane(lane)) return 0;
    return stats.laneTotals[lane - 1];
}

int classCount(const LaneDetail& detail, VehicleClass cls) {
    switch (cls) {
        case VehicleClass::Car: return detail.car;
        case VehicleClass::Bus: return detail.bus;
        case VehicleClass::Truck: return detail.truck;
        case VehicleClass::Rickshaw: return detail.rickshaw;
        case VehicleClass::Bike: return detail.bike;
        default: return 0;
    }
}
