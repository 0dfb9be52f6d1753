#ifndef TOKENFLOW_MODULES_SCHEDULER_RUNTIME_STATE_H
#define TOKENFLOW_MODULES_SCHEDULER_RUNTIME_STATE_H

#include "core/types/context.h"
#include "core/types/node.h"
#include "modules/compiler/executable_diagram.h"
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace tokenflow {

// PENDING -> READY -> RUNNING -> {COMPLETED, FAILED, SKIPPED}; loop re-arm goes back to PENDING
enum class NodeStatus : uint8_t { PENDING, READY, RUNNING, COMPLETED, FAILED, SKIPPED };

std::string to_string(NodeStatus status);

struct NodeRuntime {
    NodeStatus status = NodeStatus::PENDING;
    int execution_count = 0; // runs started
    int in_flight = 0;
    int completed = 0;
    int failed = 0;
    Epoch armed_epoch = 0;
    std::optional<NodeStatus> last_outcome; // COMPLETED or FAILED of the latest finished run
    std::optional<std::string> last_error;
};

// Per-node execution state of one run. Admission (check + increment) is one critical section.
class RuntimeState {
public:
    explicit RuntimeState(const ExecutableDiagram& diagram);

    // Admits a run if the policy allows another one right now; marks the node READY
    bool try_admit(const NodeId& node_id, ConcurrencyPolicy policy);
    // RUNNING; returns the 1-based execution number. Throws SchedulerInvariantError if not admitted.
    int begin_run(const NodeId& node_id, ConcurrencyPolicy policy);
    // Undo an admission that never started
    void cancel_admission(const NodeId& node_id);

    void complete_run(const NodeId& node_id);
    void fail_run(const NodeId& node_id, const std::string& error);
    // Finished run whose result is ignored (stale after a loop re-arm)
    void discard_run(const NodeId& node_id);

    void rearm(const NodeId& node_id, Epoch epoch);

    // Never-run nodes become SKIPPED, others take their last outcome
    void finalize();

    NodeRuntime get(const NodeId& node_id) const;
    NodeStatus status(const NodeId& node_id) const { return get(node_id).status; }
    int execution_count(const NodeId& node_id) const { return get(node_id).execution_count; }
    int in_flight(const NodeId& node_id) const { return get(node_id).in_flight; }
    Epoch armed_epoch(const NodeId& node_id) const { return get(node_id).armed_epoch; }
    int total_in_flight() const;
    std::map<NodeId, NodeRuntime> all() const;

    nlohmann::json snapshot() const;
    void restore(const nlohmann::json& state);

private:
    mutable std::mutex mutex_;
    std::map<NodeId, NodeRuntime> nodes_;

    NodeRuntime& at_locked(const NodeId& node_id);
    void finish_locked(NodeRuntime& node, NodeStatus outcome);
};

} // namespace tokenflow

#endif // TOKENFLOW_MODULES_SCHEDULER_RUNTIME_STATE_H
