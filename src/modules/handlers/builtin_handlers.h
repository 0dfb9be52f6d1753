#ifndef TOKENFLOW_MODULES_HANDLERS_BUILTIN_HANDLERS_H
#define TOKENFLOW_MODULES_HANDLERS_BUILTIN_HANDLERS_H

#include "modules/handlers/handler.h"
#include "modules/handlers/handler_registry.h"
#include <nlohmann/json.hpp>

namespace tokenflow {

// Template data for a run: every input port by name, the "default" object merged at
// top level, plus node_id / epoch / execution_number.
nlohmann::json template_data(const PortMap& inputs, const RunContext& context);

// Single input: its payload. Several: {port: payload}.
EnvelopePtr merge_inputs(const PortMap& inputs);

class StartHandler : public Handler {
public:
    HandlerResult execute(const PortMap& inputs, const nlohmann::json& config, const RunContext& context) override;
};

class EndpointHandler : public Handler {
public:
    HandlerResult execute(const PortMap& inputs, const nlohmann::json& config, const RunContext& context) override;
};

// condition_type: "custom" (inja expression) or "detect_max_iterations"
class ConditionHandler : public Handler {
public:
    HandlerResult execute(const PortMap& inputs, const nlohmann::json& config, const RunContext& context) override;
};

class TemplateJobHandler : public Handler {
public:
    HandlerResult execute(const PortMap& inputs, const nlohmann::json& config, const RunContext& context) override;
};

// start, endpoint, condition, template_job
void register_builtin_handlers(HandlerRegistry& registry);

} // namespace tokenflow

#endif // TOKENFLOW_MODULES_HANDLERS_BUILTIN_HANDLERS_H
