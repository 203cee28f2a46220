#include "runs/run_registry.hpp"

RunRegistry::RunRegistry() = default;

RunRegistry::RunRegistry(std::uint64_t seed) : rng_(seed) {}

std::string RunRegistry::create(const RunParams& params) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string id = rng_.uuid4();
    while (runs_.count(id) != 0) {
        id = rng_.uuid4();
    }
    runs_.emplace(id, std::make_shared<RunRecord>(id, params));
    order_.push_back(id);
    return id;
}

std::shared_ptr<RunRecord> RunRegistry::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(id);
    if (it == runs_.end()) {
        return nullptr;
    }
    return it->second;
}

std::size_t RunRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return runs_.size();
}

std::vector<std::string> RunRegistry::ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_;
}
