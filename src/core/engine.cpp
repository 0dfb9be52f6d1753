#include "tokenflow/core/engine.h"
#include "common/logging/logger.h"
#include "core/types/errors.h"
#include "modules/compiler/diagram_compiler.h"
#include "modules/handlers/builtin_handlers.h"
#include "modules/loader/diagram_loader.h"
#include "modules/scheduler/scheduler.h"
#include <chrono>

namespace tokenflow {

namespace {

Scheduler::Config scheduler_config(const EngineConfig& config) {
    Scheduler::Config sc;
    sc.max_workers = config.max_workers;
    if (config.run_timeout_ms) sc.run_timeout = std::chrono::milliseconds(*config.run_timeout_ms);
    if (config.default_node_timeout_ms) sc.default_node_timeout = std::chrono::milliseconds(*config.default_node_timeout_ms);
    sc.poll_interval = std::chrono::milliseconds(config.poll_interval_ms);
    sc.max_epochs = config.max_epochs;
    sc.stop_when_endpoints_complete = config.stop_when_endpoints_complete;
    return sc;
}

} // namespace

std::unique_ptr<WorkflowEngine> WorkflowEngine::from_string(const std::string& text, EngineConfig config) {
    return std::make_unique<WorkflowEngine>(DiagramLoader::parse_from_string(text), std::move(config));
}

std::unique_ptr<WorkflowEngine> WorkflowEngine::from_file(const std::string& file_path, EngineConfig config) {
    return std::make_unique<WorkflowEngine>(DiagramLoader::parse_from_file(file_path), std::move(config));
}

WorkflowEngine::WorkflowEngine(const GraphDescription& graph, EngineConfig config)
    : config_(std::move(config)) {
    set_log_level(config_.log_level);

    DiagramCompiler::Config cc;
    cc.mode = config_.compile_mode == "diagnostics" ? DiagramCompiler::Mode::DIAGNOSTICS
                                                    : DiagramCompiler::Mode::FAIL_FAST;
    CompilationResult compiled = DiagramCompiler(cc).compile_with_diagnostics(graph);
    compile_diagnostics_ = compiled.diagnostics;
    for (const auto& d : compile_diagnostics_) {
        if (d.severity == Severity::WARNING) SPDLOG_LOGGER_WARN(logger(), "{}", to_string(d));
    }
    if (!compiled.success) {
        throw CompilationFailed(std::move(compiled.diagnostics));
    }
    diagram_ = std::move(compiled.diagram);

    register_builtin_handlers(handlers_);
}

WorkflowEngine::~WorkflowEngine() = default;

void WorkflowEngine::set_text_generator(TextGenerator generator) {
    handlers_.register_handler(NodeType::PERSON_JOB, std::make_shared<PersonJobHandler>(std::move(generator)));
}

void WorkflowEngine::add_observer(ExecutionObserver* observer) {
    if (observer) observers_.push_back(observer);
}

ExecutionResult WorkflowEngine::run(const nlohmann::json& inputs) {
    Scheduler scheduler(diagram_, handlers_, scheduler_config(config_));
    for (ExecutionObserver* observer : observers_) {
        scheduler.add_observer(observer);
    }

    {
        std::lock_guard<std::mutex> lock(active_mutex_);
        active_ = &scheduler;
    }

    struct ActiveReset {
        WorkflowEngine& engine;
        ~ActiveReset() {
            std::lock_guard<std::mutex> lock(engine.active_mutex_);
            engine.active_ = nullptr;
        }
    } reset{*this};

    return scheduler.run(inputs);
}

void WorkflowEngine::cancel() {
    std::lock_guard<std::mutex> lock(active_mutex_);
    if (active_) active_->cancel();
}

} // namespace tokenflow
