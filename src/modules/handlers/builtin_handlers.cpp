#include "modules/handlers/builtin_handlers.h"
#include "common/utils/template_renderer.h"
#include <memory>
#include <stdexcept>
#include <string>

namespace tokenflow {

namespace {

std::string config_string(const nlohmann::json& config, const char* key, const std::string& fallback = "") {
    if (config.is_object()) {
        auto it = config.find(key);
        if (it != config.end() && it->is_string()) return it->get<std::string>();
    }
    return fallback;
}

} // namespace

nlohmann::json template_data(const PortMap& inputs, const RunContext& context) {
    nlohmann::json data = nlohmann::json::object();
    if (auto it = inputs.find(std::string(kDefaultPort)); it != inputs.end() && it->second && it->second->is_object()) {
        data.update(*it->second);
    }
    nlohmann::json by_port = nlohmann::json::object();
    for (const auto& [port, payload] : inputs) {
        by_port[port] = payload ? *payload : nlohmann::json();
        data[port] = by_port[port];
    }
    data["inputs"] = std::move(by_port);
    data["node_id"] = context.node_id;
    data["epoch"] = context.epoch;
    data["execution_number"] = context.execution_number;
    return data;
}

EnvelopePtr merge_inputs(const PortMap& inputs) {
    if (inputs.empty()) return make_envelope(nlohmann::json::object());
    if (inputs.size() == 1) return inputs.begin()->second;
    nlohmann::json merged = nlohmann::json::object();
    for (const auto& [port, payload] : inputs) {
        merged[port] = payload ? *payload : nlohmann::json();
    }
    return make_envelope(std::move(merged));
}

HandlerResult StartHandler::execute(const PortMap&, const nlohmann::json& config, const RunContext& context) {
    nlohmann::json payload = nlohmann::json::object();
    if (config.is_object()) {
        if (auto it = config.find("custom_data"); it != config.end() && !it->is_null()) payload = *it;
    }
    if (context.run_inputs && !context.run_inputs->is_null() && !context.run_inputs->empty()) {
        if (payload.is_object() && context.run_inputs->is_object()) {
            payload.update(*context.run_inputs); // run inputs win over custom_data
        } else {
            payload = *context.run_inputs;
        }
    }
    return HandlerResult::ok({{std::string(kDefaultPort), make_envelope(std::move(payload))}});
}

HandlerResult EndpointHandler::execute(const PortMap& inputs, const nlohmann::json&, const RunContext&) {
    return HandlerResult::ok(inputs);
}

HandlerResult ConditionHandler::execute(const PortMap& inputs, const nlohmann::json& config, const RunContext& context) {
    const std::string condition_type = config_string(config, "condition_type", "custom");

    bool verdict = false;
    if (condition_type == "detect_max_iterations") {
        verdict = context.loop_exhausted;
    } else if (condition_type == "custom") {
        const std::string expression = config_string(config, "expression");
        if (expression.empty()) {
            return HandlerResult::failure("Condition '" + context.node_id + "' has no expression");
        }
        verdict = InjaTemplateRenderer::evaluate_shared(expression, template_data(inputs, context));
    } else {
        return HandlerResult::failure("Unsupported condition_type '" + condition_type + "'");
    }

    const PortName port(verdict ? kCondTruePort : kCondFalsePort);
    return HandlerResult::ok({{port, merge_inputs(inputs)}});
}

HandlerResult TemplateJobHandler::execute(const PortMap& inputs, const nlohmann::json& config, const RunContext& context) {
    if (!config.is_object() || !config.contains("template") || !config["template"].is_string()) {
        return HandlerResult::failure("template_job '" + context.node_id + "' has no template");
    }
    std::string rendered = InjaTemplateRenderer::render_shared(config["template"].get<std::string>(),
                                                               template_data(inputs, context));
    return HandlerResult::ok({{std::string(kDefaultPort), make_envelope(std::move(rendered))}});
}

void register_builtin_handlers(HandlerRegistry& registry) {
    registry.register_handler(NodeType::START, std::make_shared<StartHandler>());
    registry.register_handler(NodeType::ENDPOINT, std::make_shared<EndpointHandler>());
    registry.register_handler(NodeType::CONDITION, std::make_shared<ConditionHandler>());
    registry.register_handler(NodeType::TEMPLATE_JOB, std::make_shared<TemplateJobHandler>());
}

} // namespace tokenflow
