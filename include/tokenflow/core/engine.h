#ifndef TOKENFLOW_CORE_ENGINE_H
#define TOKENFLOW_CORE_ENGINE_H

#include "common/config/engine_config.h"
#include "core/types/diagnostic.h"
#include "core/types/graph_description.h"
#include "modules/compiler/executable_diagram.h"
#include "modules/handlers/handler_registry.h"
#include "modules/handlers/person_job_handler.h"
#include "modules/scheduler/execution_result.h"
#include "modules/trace/execution_observer.h"
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace tokenflow {

class Scheduler;

// Compiled diagram + handlers + configuration. Each run() gets a fresh Scheduler.
class WorkflowEngine {
public:
    // Throw DiagramLoadError / CompilationFailed
    static std::unique_ptr<WorkflowEngine> from_string(const std::string& text, EngineConfig config = EngineConfig());
    static std::unique_ptr<WorkflowEngine> from_file(const std::string& file_path, EngineConfig config = EngineConfig());

    // Compiles; built-in handlers are pre-registered
    explicit WorkflowEngine(const GraphDescription& graph, EngineConfig config = EngineConfig());
    ~WorkflowEngine();

    ExecutionResult run(const nlohmann::json& inputs = nlohmann::json::object());

    // From any thread; cancels the run in progress, if any
    void cancel();

    template<typename Func>
    void register_handler(NodeType type, Func&& func) {
        handlers_.register_handler(type, std::forward<Func>(func));
    }

    // Registers person_job
    void set_text_generator(TextGenerator generator);

    // Non-owning; must outlive every run()
    void add_observer(ExecutionObserver* observer);

    const ExecutableDiagram& diagram() const { return *diagram_; }
    const Diagnostics& compile_diagnostics() const { return compile_diagnostics_; }
    const EngineConfig& config() const { return config_; }
    HandlerRegistry& handlers() { return handlers_; }

private:
    EngineConfig config_;
    std::shared_ptr<const ExecutableDiagram> diagram_;
    Diagnostics compile_diagnostics_;
    HandlerRegistry handlers_;
    std::vector<ExecutionObserver*> observers_;

    std::mutex active_mutex_;
    Scheduler* active_ = nullptr;
};

} // namespace tokenflow

#endif // TOKENFLOW_CORE_ENGINE_H
