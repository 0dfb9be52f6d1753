#include "modules/handlers/person_job_handler.h"
#include "common/logging/logger.h"
#include "common/utils/template_renderer.h"
#include "modules/handlers/builtin_handlers.h"
#include <stdexcept>
#include <utility>

namespace tokenflow {

PersonJobHandler::PersonJobHandler(TextGenerator generator) : generator_(std::move(generator)) {
    if (!generator_) {
        throw std::invalid_argument("PersonJobHandler requires a text generator");
    }
}

std::string PersonJobHandler::build_prompt(const PortMap& inputs, const nlohmann::json& config, const RunContext& context) {
    std::string prompt_template;
    if (context.execution_number == 1 && config.contains("first_only_prompt") && config["first_only_prompt"].is_string()) {
        prompt_template = config["first_only_prompt"].get<std::string>();
    } else if (config.contains("default_prompt") && config["default_prompt"].is_string()) {
        prompt_template = config["default_prompt"].get<std::string>();
    } else {
        throw std::runtime_error("person_job '" + context.node_id + "' has no prompt");
    }

    const nlohmann::json data = template_data(inputs, context);
    std::string prompt = InjaTemplateRenderer::render_shared(prompt_template, data);
    if (config.contains("system_prompt") && config["system_prompt"].is_string()) {
        prompt = InjaTemplateRenderer::render_shared(config["system_prompt"].get<std::string>(), data) + "\n\n" + prompt;
    }
    return prompt;
}

HandlerResult PersonJobHandler::execute(const PortMap& inputs, const nlohmann::json& config, const RunContext& context) {
    const std::string prompt = build_prompt(inputs, config, context);

    std::lock_guard<std::mutex> lock(mutex_);
    if (context.is_cancelled()) {
        return HandlerResult::failure("person_job '" + context.node_id + "' cancelled before generation");
    }
    SPDLOG_LOGGER_DEBUG(logger(), "person_job {} (run {}): prompt of {} chars", context.node_id,
                        context.execution_number, prompt.size());
    std::string response = generator_(prompt);
    return HandlerResult::ok({{std::string(kDefaultPort), make_envelope(std::move(response))}});
}

} // namespace tokenflow
