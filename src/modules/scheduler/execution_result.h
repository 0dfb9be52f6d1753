#ifndef TOKENFLOW_MODULES_SCHEDULER_EXECUTION_RESULT_H
#define TOKENFLOW_MODULES_SCHEDULER_EXECUTION_RESULT_H

#include "core/types/context.h"
#include "core/types/diagnostic.h"
#include "modules/scheduler/runtime_state.h"
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace tokenflow {

enum class RunStatus : uint8_t { COMPLETED, FAILED, CANCELLED, TIMED_OUT };

std::string to_string(RunStatus status);

struct NodeOutcome {
    NodeStatus status = NodeStatus::SKIPPED;
    int execution_count = 0;
    std::optional<std::string> error;
};

struct ExecutionResult {
    bool success = false;
    std::string message;
    RunStatus status = RunStatus::COMPLETED;
    std::string execution_id;
    std::map<NodeId, NodeOutcome> nodes;
    Diagnostics diagnostics;
    nlohmann::json outputs = nlohmann::json::object(); // endpoint id -> {port: payload}
    Epoch final_epoch = 0;
    std::chrono::milliseconds duration{0};

    nlohmann::json to_json() const;
};

} // namespace tokenflow

#endif // TOKENFLOW_MODULES_SCHEDULER_EXECUTION_RESULT_H
