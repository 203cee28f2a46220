#include "model/types.hpp"

std::string runStatusName(RunStatus status) {
    switch (status) {
        case RunStatus::Running: return "running";
        case RunStatus::Finished: return "finished";
        case RunStatus::Error: return "error";
        case RunStatus::Stopped: return "stopped";
        default: return "unknown";
    }
}

bool isTerminal(RunStatus status) {
    return status != RunStatus::Running;
}

bool isValidLane(int lane) {
    return lane >= 1 && lane <= kLaneCount;
}
