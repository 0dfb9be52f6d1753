#include "modules/scheduler/runtime_state.h"
#include "core/types/errors.h"
#include <stdexcept>

namespace tokenflow {

std::string to_string(NodeStatus status) {
    switch (status) {
        case NodeStatus::PENDING: return "pending";
        case NodeStatus::READY: return "ready";
        case NodeStatus::RUNNING: return "running";
        case NodeStatus::COMPLETED: return "completed";
        case NodeStatus::FAILED: return "failed";
        case NodeStatus::SKIPPED: return "skipped";
    }
    return "unknown";
}

namespace {

std::optional<NodeStatus> parse_status(const std::string& name) {
    for (auto s : {NodeStatus::PENDING, NodeStatus::READY, NodeStatus::RUNNING,
                   NodeStatus::COMPLETED, NodeStatus::FAILED, NodeStatus::SKIPPED}) {
        if (to_string(s) == name) return s;
    }
    return std::nullopt;
}

} // namespace

RuntimeState::RuntimeState(const ExecutableDiagram& diagram) {
    for (const auto& node : diagram.nodes()) {
        nodes_.emplace(node.id, NodeRuntime{});
    }
}

NodeRuntime& RuntimeState::at_locked(const NodeId& node_id) {
    auto it = nodes_.find(node_id);
    if (it == nodes_.end()) {
        throw std::out_of_range("Unknown node: " + node_id);
    }
    return it->second;
}

bool RuntimeState::try_admit(const NodeId& node_id, ConcurrencyPolicy policy) {
    std::lock_guard<std::mutex> lock(mutex_);
    NodeRuntime& node = at_locked(node_id);
    if (!policy.admits(node.in_flight)) return false;
    ++node.in_flight;
    node.status = NodeStatus::READY;
    return true;
}

int RuntimeState::begin_run(const NodeId& node_id, ConcurrencyPolicy policy) {
    std::lock_guard<std::mutex> lock(mutex_);
    NodeRuntime& node = at_locked(node_id);
    if (node.in_flight < 1 || !policy.admits(node.in_flight - 1)) {
        throw SchedulerInvariantError("node '" + node_id + "' started with " + std::to_string(node.in_flight) +
                                      " in-flight runs under policy " + to_string(policy));
    }
    node.status = NodeStatus::RUNNING;
    return ++node.execution_count;
}

void RuntimeState::cancel_admission(const NodeId& node_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    NodeRuntime& node = at_locked(node_id);
    if (node.in_flight < 1) {
        throw SchedulerInvariantError("admission released twice for node '" + node_id + "'");
    }
    --node.in_flight;
    if (node.in_flight == 0) {
        node.status = node.last_outcome.value_or(NodeStatus::PENDING);
    }
}

void RuntimeState::finish_locked(NodeRuntime& node, NodeStatus outcome) {
    if (node.in_flight < 1) {
        throw SchedulerInvariantError("run finished with no run in flight");
    }
    --node.in_flight;
    node.last_outcome = outcome;
    if (node.in_flight == 0) node.status = outcome;
}

void RuntimeState::complete_run(const NodeId& node_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    NodeRuntime& node = at_locked(node_id);
    finish_locked(node, NodeStatus::COMPLETED);
    ++node.completed;
}

void RuntimeState::fail_run(const NodeId& node_id, const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    NodeRuntime& node = at_locked(node_id);
    finish_locked(node, NodeStatus::FAILED);
    ++node.failed;
    node.last_error = error;
}

void RuntimeState::discard_run(const NodeId& node_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    NodeRuntime& node = at_locked(node_id);
    if (node.in_flight < 1) {
        throw SchedulerInvariantError("stale run discarded with no run in flight");
    }
    --node.in_flight;
    if (node.in_flight == 0) node.status = NodeStatus::PENDING;
}

void RuntimeState::rearm(const NodeId& node_id, Epoch epoch) {
    std::lock_guard<std::mutex> lock(mutex_);
    NodeRuntime& node = at_locked(node_id);
    if (epoch < node.armed_epoch) {
        throw SchedulerInvariantError("node '" + node_id + "' re-armed backwards to epoch " + std::to_string(epoch));
    }
    node.armed_epoch = epoch;
    if (node.in_flight == 0) node.status = NodeStatus::PENDING;
}

void RuntimeState::finalize() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, node] : nodes_) {
        if (node.in_flight > 0) {
            node.status = NodeStatus::FAILED;
            node.last_error = "cancelled while running";
            node.in_flight = 0;
        } else if (node.execution_count == 0) {
            node.status = NodeStatus::SKIPPED;
        } else {
            node.status = node.last_outcome.value_or(NodeStatus::FAILED);
        }
    }
}

NodeRuntime RuntimeState::get(const NodeId& node_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = nodes_.find(node_id);
    if (it == nodes_.end()) {
        throw std::out_of_range("Unknown node: " + node_id);
    }
    return it->second;
}

int RuntimeState::total_in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    int total = 0;
    for (const auto& [id, node] : nodes_) total += node.in_flight;
    return total;
}

std::map<NodeId, NodeRuntime> RuntimeState::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nodes_;
}

nlohmann::json RuntimeState::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json state = nlohmann::json::object();
    for (const auto& [id, node] : nodes_) {
        nlohmann::json j;
        // in-flight runs do not survive a restore
        j["status"] = to_string(node.in_flight > 0 ? node.last_outcome.value_or(NodeStatus::PENDING) : node.status);
        j["execution_count"] = node.execution_count - node.in_flight;
        j["completed"] = node.completed;
        j["failed"] = node.failed;
        j["armed_epoch"] = node.armed_epoch;
        j["last_outcome"] = node.last_outcome ? nlohmann::json(to_string(*node.last_outcome)) : nlohmann::json(nullptr);
        j["last_error"] = node.last_error ? nlohmann::json(*node.last_error) : nlohmann::json(nullptr);
        state[id] = std::move(j);
    }
    return state;
}

void RuntimeState::restore(const nlohmann::json& state) {
    std::map<NodeId, NodeRuntime> restored;
    try {
        for (const auto& [id, j] : state.items()) {
            if (!nodes_.count(id)) {
                throw std::invalid_argument("Runtime snapshot references unknown node '" + id + "'");
            }
            NodeRuntime node;
            auto status = parse_status(j.at("status").get<std::string>());
            if (!status) {
                throw std::invalid_argument("Runtime snapshot has an invalid status for node '" + id + "'");
            }
            node.status = *status;
            node.execution_count = j.at("execution_count").get<int>();
            node.completed = j.value("completed", 0);
            node.failed = j.value("failed", 0);
            node.armed_epoch = j.value("armed_epoch", 0);
            if (j.contains("last_outcome") && j.at("last_outcome").is_string()) {
                node.last_outcome = parse_status(j.at("last_outcome").get<std::string>());
            }
            if (j.contains("last_error") && j.at("last_error").is_string()) {
                node.last_error = j.at("last_error").get<std::string>();
            }
            restored.emplace(id, std::move(node));
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("Malformed runtime snapshot: ") + e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, node] : nodes_) {
        auto it = restored.find(id);
        node = it == restored.end() ? NodeRuntime{} : it->second;
    }
}

} // namespace tokenflow
