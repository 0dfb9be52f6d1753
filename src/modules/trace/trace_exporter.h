#ifndef TOKENFLOW_MODULES_TRACE_TRACE_EXPORTER_H
#define TOKENFLOW_MODULES_TRACE_TRACE_EXPORTER_H

#include "core/types/context.h"
#include "core/types/node.h"
#include "modules/trace/execution_observer.h"
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tokenflow {

struct TraceRecord {
    std::string trace_id;
    NodeId node_id;
    std::string type; // NodeType wire name
    Epoch epoch = 0;
    int execution_number = 0;
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
    std::string status; // "running", "success", "failed"
    std::optional<std::string> error;
    std::vector<PortName> output_ports; // ports that carried a payload
};

struct EpochRecord {
    Epoch epoch = 0;
    NodeId loop_head;
    std::chrono::system_clock::time_point time;
};

// Built-in observer: one TraceRecord per node run
class TraceExporter : public ExecutionObserver {
public:
    TraceExporter() = default;
    explicit TraceExporter(std::string trace_id) : current_trace_id_(std::move(trace_id)) {}

    void on_node_start(const NodeId& node_id, NodeType type, Epoch epoch, int execution_number) override;
    void on_node_complete(const NodeId& node_id, Epoch epoch, const PortMap& outputs) override;
    void on_node_failed(const NodeId& node_id, Epoch epoch, const std::string& error) override;
    void on_epoch_begin(Epoch epoch, const NodeId& loop_head) override;
    void on_run_complete(const ExecutionResult& result) override;

    std::vector<TraceRecord> get_traces() const;
    const std::vector<EpochRecord>& get_epochs() const { return epochs_; }
    const nlohmann::json& run_summary() const { return run_summary_; }
    void clear_traces();

    nlohmann::json to_json() const;

private:
    std::vector<TraceRecord> traces_;
    std::vector<EpochRecord> epochs_;
    nlohmann::json run_summary_ = nlohmann::json::object();
    std::string current_trace_id_ = "t-default";

    TraceRecord* find_running(const NodeId& node_id, Epoch epoch);
};

} // namespace tokenflow

#endif // TOKENFLOW_MODULES_TRACE_TRACE_EXPORTER_H
