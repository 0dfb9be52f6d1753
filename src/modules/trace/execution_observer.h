#ifndef TOKENFLOW_MODULES_TRACE_EXECUTION_OBSERVER_H
#define TOKENFLOW_MODULES_TRACE_EXECUTION_OBSERVER_H

#include "core/types/context.h"
#include "core/types/node.h"
#include <string>

namespace tokenflow {

struct ExecutionResult;

// Execution events, all delivered on the scheduler thread
class ExecutionObserver {
public:
    virtual ~ExecutionObserver() = default;

    virtual void on_node_start(const NodeId& node_id, NodeType type, Epoch epoch, int execution_number) {}
    virtual void on_node_complete(const NodeId& node_id, Epoch epoch, const PortMap& outputs) {}
    virtual void on_node_failed(const NodeId& node_id, Epoch epoch, const std::string& error) {}
    virtual void on_epoch_begin(Epoch epoch, const NodeId& loop_head) {}
    virtual void on_run_complete(const ExecutionResult& result) {}
};

} // namespace tokenflow

#endif // TOKENFLOW_MODULES_TRACE_EXECUTION_OBSERVER_H
