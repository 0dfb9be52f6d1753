#include "modules/trace/trace_exporter.h"
#include "modules/scheduler/execution_result.h"
#include <algorithm>
#include <chrono>

namespace tokenflow {

namespace {

long long to_millis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace

void TraceExporter::on_node_start(const NodeId& node_id, NodeType type, Epoch epoch, int execution_number) {
    TraceRecord record;
    record.trace_id = current_trace_id_;
    record.node_id = node_id;
    record.type = to_string(type);
    record.epoch = epoch;
    record.execution_number = execution_number;
    record.start_time = std::chrono::system_clock::now();
    record.status = "running"; // updated in on_node_complete / on_node_failed
    traces_.push_back(std::move(record));
}

TraceRecord* TraceExporter::find_running(const NodeId& node_id, Epoch epoch) {
    // oldest matching run first
    auto it = std::find_if(traces_.begin(), traces_.end(), [&](const TraceRecord& r) {
        return r.node_id == node_id && r.epoch == epoch && r.status == "running";
    });
    return it == traces_.end() ? nullptr : &*it;
}

void TraceExporter::on_node_complete(const NodeId& node_id, Epoch epoch, const PortMap& outputs) {
    if (TraceRecord* record = find_running(node_id, epoch)) {
        record->end_time = std::chrono::system_clock::now();
        record->status = "success";
        for (const auto& [port, payload] : outputs) {
            if (payload && !payload->is_null()) record->output_ports.push_back(port);
        }
    }
}

void TraceExporter::on_node_failed(const NodeId& node_id, Epoch epoch, const std::string& error) {
    if (TraceRecord* record = find_running(node_id, epoch)) {
        record->end_time = std::chrono::system_clock::now();
        record->status = "failed";
        record->error = error;
    }
}

void TraceExporter::on_epoch_begin(Epoch epoch, const NodeId& loop_head) {
    epochs_.push_back({epoch, loop_head, std::chrono::system_clock::now()});
}

void TraceExporter::on_run_complete(const ExecutionResult& result) {
    for (auto& record : traces_) {
        if (record.trace_id == "t-default") record.trace_id = result.execution_id;
    }
    run_summary_ = {
        {"execution_id", result.execution_id},
        {"status", to_string(result.status)},
        {"success", result.success},
        {"final_epoch", result.final_epoch},
        {"duration_ms", result.duration.count()}
    };
}

std::vector<TraceRecord> TraceExporter::get_traces() const {
    return traces_;
}

void TraceExporter::clear_traces() {
    traces_.clear();
    epochs_.clear();
    run_summary_ = nlohmann::json::object();
}

nlohmann::json TraceExporter::to_json() const {
    nlohmann::json j;
    j["run"] = run_summary_;
    j["traces"] = nlohmann::json::array();
    for (const auto& r : traces_) {
        nlohmann::json jr = {
            {"trace_id", r.trace_id},
            {"node_id", r.node_id},
            {"type", r.type},
            {"epoch", r.epoch},
            {"execution_number", r.execution_number},
            {"start_ms", to_millis(r.start_time)},
            {"status", r.status},
            {"output_ports", r.output_ports}
        };
        if (r.status != "running") {
            jr["end_ms"] = to_millis(r.end_time);
            jr["duration_ms"] = to_millis(r.end_time) - to_millis(r.start_time);
        }
        if (r.error) jr["error"] = *r.error;
        j["traces"].push_back(std::move(jr));
    }
    j["epochs"] = nlohmann::json::array();
    for (const auto& e : epochs_) {
        j["epochs"].push_back({{"epoch", e.epoch}, {"loop_head", e.loop_head}, {"time_ms", to_millis(e.time)}});
    }
    return j;
}

} // namespace tokenflow
