#include "model/run_record.hpp"

#include <utility>

RunRecord::RunRecord(std::string runId, const RunParams& runParams)
    : id(std::move(runId)), params(runParams) {}

std::vector<std::string> tailOf(const std::vector<std::string>& lines, std::size_t count) {
    std::size_t start = lines.size() > count ? lines.size() - count : 0;
    return std::vector<std::string>(lines.begin() + static_cast<std::ptrdiff_t>(start), lines.end());
}

RunSnapshot takeSnapshot(RunRecord& record, std::size_t tailLines) {
    RunSnapshot snap;
    snap.id = record.id;
    snap.params = record.params;
    std::lock_guard<std::mutex> lock(record.mutex);
    snap.status = record.status;
    snap.logTail = tailOf(record.log, tailLines);
    snap.logSize = record.log.size();
    snap.stats = record.stats;
    return snap;
}
