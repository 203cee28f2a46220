#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>

#include "ipc/signals.hpp"
#include "model/config.hpp"
#include "model/run_params.hpp"
#include "report/status_report.hpp"
#include "runs/run_service.hpp"
#include "telemetry/line_parser.hpp"
#include "telemetry/stats_aggregator.hpp"

namespace {
constexpr int kExitStopped = 2;

/**
 * @brief Resolve configuration: explicit path, else dashboard.cfg in the
 * current directory, then its parent, else built-in defaults.
 */
bool loadConfig(const std::string& explicitPath, Config& cfg, std::string& err) {
    if (!explicitPath.empty()) {
        return parseConfigFile(explicitPath, cfg, err);
    }
    for (const char* candidate : {"dashboard.cfg", "../dashboard.cfg"}) {
        std::ifstream probe(candidate);
        if (probe) {
            return parseConfigFile(candidate, cfg, err);
        }
    }
    cfg = defaultConfig();
    return validateConfig(cfg, err);
}

int runReplay(const std::string& logPath, int simTime) {
    std::ifstream in(logPath);
    if (!in) {
        std::cerr << "Cannot open log file: " << logPath << std::endl;
        return EXIT_FAILURE;
    }
    RunParams params;
    params.simTime = simTime;
    RunStats stats;
    bool complete = false;
    std::size_t lines = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        LineOutcome outcome = applyLine(line, stats, params);
        stats = outcome.stats;
        complete = complete || outcome.complete;
        ++lines;
    }
    std::cout << "Replayed " << lines << " lines from " << logPath
              << (complete ? " (simulation complete)" : "") << "\n";
    writeStatsReport(stats, std::cout);
    return EXIT_SUCCESS;
}

// Print the log lines appended since the previous poll; lines that already
// scrolled out of the tail window are skipped.
void echoNewLines(const RunSnapshot& snap, std::size_t& printed) {
    if (snap.logSize <= printed) return;
    std::size_t fresh = std::min(snap.logSize - printed, snap.logTail.size());
    for (std::size_t i = snap.logTail.size() - fresh; i < snap.logTail.size(); ++i) {
        std::cout << snap.logTail[i] << "\n";
    }
    std::cout << std::flush;
    printed = snap.logSize;
}

int runDashboard(const Config& cfg, const RunParams& params) {
    if (!Signals::watch(SIGINT) || !Signals::watch(SIGTERM)) {
        return EXIT_FAILURE;
    }
    Signals::ignore(SIGPIPE);

    RunService service(cfg);
    StartResult started = service.start(params);
    std::cout << "Started run " << started.runId << " (simTime=" << params.simTime
              << " minGreen=" << params.minGreen << " maxGreen=" << params.maxGreen
              << ")" << std::endl;

    RunSnapshot snap;
    std::size_t printed = 0;
    bool stopSent = false;
    while (true) {
        if (!service.status(started.runId, snap)) {
            std::cerr << "Run disappeared: " << started.runId << std::endl;
            return EXIT_FAILURE;
        }
        echoNewLines(snap, printed);
        if (isTerminal(snap.status)) break;

        if (!stopSent && Signals::pending() != 0) {
            std::cout << "Stopping run " << started.runId << std::endl;
            StopResult stopped;
            if (!service.stop(started.runId, stopped)) {
                std::cerr << "Stop failed, unknown run: " << started.runId << std::endl;
                return EXIT_FAILURE;
            }
            stopSent = true;
            continue;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(cfg.pollIntervalMs));
    }

    // Let the reader thread drain the remaining output before the final report.
    service.shutdown();
    if (service.status(started.runId, snap)) {
        echoNewLines(snap, printed);
    }
    std::cout << "\n";
    writeStatusReport(snap, std::cout);

    switch (snap.status) {
        case RunStatus::Finished: return EXIT_SUCCESS;
        case RunStatus::Stopped: return kExitStopped;
        default: return EXIT_FAILURE;
    }
}

void printUsage(const char* prog) {
    std::cerr << "Usage: " << prog << " [--config <path>] [simTime minGreen maxGreen]\n"
              << "       " << prog << " replay <logPath> [simTime]" << std::endl;
}
} // namespace

// Entry point: run a simulation under the dashboard, or replay a captured worker log.
int main(int argc, char* argv[]) {
    if (argc >= 2 && std::string(argv[1]) == "replay") {
        if (argc < 3) {
            printUsage(argv[0]);
            return EXIT_FAILURE;
        }
        int simTime = RunParams{}.simTime;
        if (argc >= 4 && !parseIntStrict(argv[3], simTime)) {
            std::cerr << "Invalid simTime: " << argv[3] << std::endl;
            return EXIT_FAILURE;
        }
        return runReplay(argv[2], simTime);
    }

    int argi = 1;
    std::string configPath;
    if (argc >= 2 && std::string(argv[1]) == "--config") {
        if (argc < 3) {
            printUsage(argv[0]);
            return EXIT_FAILURE;
        }
        configPath = argv[2];
        argi = 3;
    }

    Config cfg = defaultConfig();
    std::string err;
    if (!loadConfig(configPath, cfg, err)) {
        std::cerr << "Config error: " << err << std::endl;
        return EXIT_FAILURE;
    }

    RunParams params = defaultParams(cfg);
    int positional = argc - argi;
    if (positional != 0 && positional != 3) {
        printUsage(argv[0]);
        return EXIT_FAILURE;
    }
    if (positional == 3) {
        if (!parseIntStrict(argv[argi], params.simTime) ||
            !parseIntStrict(argv[argi + 1], params.minGreen) ||
            !parseIntStrict(argv[argi + 2], params.maxGreen)) {
            std::cerr << "Invalid numeric argument" << std::endl;
            return EXIT_FAILURE;
        }
    }
    return runDashboard(cfg, params);
}
