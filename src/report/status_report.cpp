#include "report/status_report.hpp"

#include <iomanip>
#include <sstream>

std::string formatReal(double value, int decimals) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(decimals) << value;
    return oss.str();
}

void writeStatsReport(const RunStats& stats, std::ostream& out) {
    out << "Current phase: " << (stats.phase.empty() ? "-" : stats.phase) << "\n";
    out << "Lanes:\n";
    out << "  lane   total    car    bus  truck  rickshaw   bike\n";
    for (int lane = 1; lane <= kLaneCount; ++lane) {
        const LaneDetail& d = stats.laneDetails[lane - 1];
        out << "  " << std::setw(4) << lane
            << std::setw(8) << laneTotal(stats, lane)
            << std::setw(7) << classCount(d, VehicleClass::Car)
            << std::setw(7) << classCount(d, VehicleClass::Bus)
            << std::setw(7) << classCount(d, VehicleClass::Truck)
            << std::setw(10) << classCount(d, VehicleClass::Rickshaw)
            << std::setw(7) << classCount(d, VehicleClass::Bike) << "\n";
    }
    out << "Total vehicles passed: " << stats.totalVehicles << "\n";
    out << "Total time passed: " << stats.totalTime << "\n";
    out << "Throughput (vehicles/unit time): " << formatReal(stats.throughput, 3) << "\n";
    out << "Average wait: " << formatReal(stats.averageWait, 2) << "\n";
    out << "Traffic density: " << formatReal(stats.trafficDensity, 1) << "%\n";
    out << "Congestion level: " << formatReal(stats.congestionLevel, 1) << "%\n";
}

void writeStatusReport(const RunSnapshot& snapshot, std::ostream& out) {
    out << "Traffic Simulation Run\n";
    out << "======================\n";
    out << "Run id: " << snapshot.id << "\n";
    out << "Status: " << runStatusName(snapshot.status) << "\n";
    out << "Parameters: simTime=" << snapshot.params.simTime
        << " minGreen=" << snapshot.params.minGreen
        << " maxGreen=" << snapshot.params.maxGreen << "\n";
    out << "Log lines: " << snapshot.logSize
        << " (showing last " << snapshot.logTail.size() << ")\n";
    writeStatsReport(snapshot.stats, out);
}
