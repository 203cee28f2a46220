#include "model/config.hpp"

#include "telemetry/line_parser.hpp"

#include <fstream>
#include <sys/stat.h>

Config defaultConfig() {
    Config cfg;
    cfg.workerExecutable = "python3";
    cfg.workerArgs = {"simulation.py"};
    cfg.projectRoot = ".";
    cfg.logTailLines = 300;
    cfg.stopGraceMs = 3000;
    cfg.pollIntervalMs = 500;
    cfg.defaultSimTime = 120;
    cfg.defaultMinGreen = 10;
    cfg.defaultMaxGreen = 60;
    cfg.serviceLogPath = "dashboard_service.log";
    return cfg;
}

RunParams defaultParams(const Config& cfg) {
    RunParams params;
    params.simTime = cfg.defaultSimTime;
    params.minGreen = cfg.defaultMinGreen;
    params.maxGreen = cfg.defaultMaxGreen;
    return params;
}

bool parseConfigFile(const std::string& path, Config& cfg, std::string& err) {
    std::ifstream in(path);
    if (!in) {
        err = "Cannot open config file: " + path;
        return false;
    }
    cfg = defaultConfig();

    auto readInt = [&](const std::string& key, const std::string& val, int& out) {
        if (!parseIntStrict(val, out)) {
            err = "Invalid value for key: " + key;
            return false;
        }
        return true;
    };

    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto pos = line.find('=');
        if (pos == std::string::npos) continue;
        std::string key = trim(line.substr(0, pos));
        std::string val = trim(line.substr(pos + 1));
        bool ok = true;
        if (key == "workerExecutable") cfg.workerExecutable = val;
        else if (key == "workerArgs") cfg.workerArgs = splitWhitespace(val);
        else if (key == "projectRoot") cfg.projectRoot = val;
        else if (key == "serviceLogPath") cfg.serviceLogPath = val;
        else if (key == "logTailLines") ok = readInt(key, val, cfg.logTailLines);
        else if (key == "stopGraceMs") ok = readInt(key, val, cfg.stopGraceMs);
        else if (key == "pollIntervalMs") ok = readInt(key, val, cfg.pollIntervalMs);
        else if (key == "defaultSimTime") ok = readInt(key, val, cfg.defaultSimTime);
        else if (key == "defaultMinGreen") ok = readInt(key, val, cfg.defaultMinGreen);
        else if (key == "defaultMaxGreen") ok = readInt(key, val, cfg.defaultMaxGreen);
        if (!ok) {
            return false;
        }
    }
    return validateConfig(cfg, err);
}

bool validateConfig(const Config& cfg, std::string& err) {
    if (cfg.workerExecutable.empty()) {
        err = "workerExecutable must not be empty";
        return false;
    }
    if (cfg.logTailLines <= 0) {
        err = "logTailLines must be > 0";
        return false;
    }
    if (cfg.stopGraceMs < 0) {
        err = "stopGraceMs must be >= 0";
        return false;
    }
    if (cfg.pollIntervalMs <= 0) {
        err = "pollIntervalMs must be > 0";
        return false;
    }
    struct stat st {};
    if (::stat(cfg.projectRoot.c_str(), &st) == -1 || !S_ISDIR(st.st_mode)) {
        err = "projectRoot is not a directory: " + cfg.projectRoot;
        return false;
    }
    return true;
}
