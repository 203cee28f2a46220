#include "process/worker_env.hpp"

std::vector<std::string> environmentFrom(char** envp) {
    std::vector<std::string> env;
    if (!envp) return env;
    for (char** it = envp; *it; ++it) {
        env.emplace_back(*it);
    }
    return env;
}

bool findEnvValue(const std::vector<std::string>& env, const std::string& key, std::string& out) {
    const std::string prefix = key + "=";
    for (const auto& entry : env) {
        if (entry.compare(0, prefix.size(), prefix) == 0) {
            out = entry.substr(prefix.size());
            return true;
        }
    }
    return false;
}

void setEnvValue(std::vector<std::string>& env, const std::string& key, const std::string& value,
                 bool overwrite) {
    const std::string prefix = key + "=";
    for (auto& entry : env) {
        if (entry.compare(0, prefix.size(), prefix) == 0) {
            if (overwrite) {
                entry = prefix + value;
            }
            return;
        }
    }
    env.push_back(prefix + value);
}

std::vector<std::string> buildWorkerEnvironment(const RunParams& params,
                                                const std::vector<std::string>& base) {
    std::vector<std::string> env = base;
    setEnvValue(env, "SIM_TIME", std::to_string(params.simTime));
    setEnvValue(env, "MIN_GREEN_TIME", std::to_string(params.minGreen));
    setEnvValue(env, "MAX_GREEN_TIME", std::to_string(params.maxGreen));
    setEnvValue(env, "PYGAME_HIDE_SUPPORT_PROMPT", "1", false);

    std::string display;
    if (!findEnvValue(env, "DISPLAY", display) || display.empty()) {
        setEnvValue(env, "SDL_VIDEODRIVER", "dummy", false);
        setEnvValue(env, "SDL_AUDIODRIVER", "dummy", false);
    }
    return env;
}
