#ifndef TOKENFLOW_MODULES_SCHEDULER_SCHEDULER_H
#define TOKENFLOW_MODULES_SCHEDULER_SCHEDULER_H

#include "core/types/context.h"
#include "core/types/diagnostic.h"
#include "core/types/run_context.h"
#include "modules/compiler/executable_diagram.h"
#include "modules/handlers/handler_registry.h"
#include "modules/scheduler/completion_channel.h"
#include "modules/scheduler/execution_result.h"
#include "modules/scheduler/runtime_state.h"
#include "modules/scheduler/worker_pool.h"
#include "modules/tokens/token_manager.h"
#include "modules/trace/execution_observer.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace tokenflow {

// Drives one run of a compiled diagram. Single-threaded event loop; handlers run on a WorkerPool
// and report back over a CompletionChannel. One Scheduler per run.
class Scheduler {
public:
    struct Config {
        int max_workers = 4;
        std::optional<std::chrono::milliseconds> run_timeout;
        std::optional<std::chrono::milliseconds> default_node_timeout; // nodes without timeout_ms
        std::chrono::milliseconds poll_interval{50};
        int max_epochs = 1000;
        bool stop_when_endpoints_complete = true;
        std::string execution_id; // generated when empty
        Config() = default;
    };

    Scheduler(std::shared_ptr<const ExecutableDiagram> diagram, const HandlerRegistry& handlers);
    Scheduler(std::shared_ptr<const ExecutableDiagram> diagram, const HandlerRegistry& handlers, Config config);

    // Non-owning; must outlive run()
    void add_observer(ExecutionObserver* observer);

    // Throws SchedulerInvariantError on engine bugs; std::logic_error if called twice
    ExecutionResult run(nlohmann::json initial_inputs = nlohmann::json::object());

    // Thread-safe
    void cancel();

    // Token manager + runtime state; restore() only before run()
    nlohmann::json snapshot() const;
    void restore(const nlohmann::json& state);

    const TokenManager& tokens() const { return tokens_; }
    const RuntimeState& state() const { return state_; }
    const std::string& execution_id() const { return config_.execution_id; }

private:
    using RunId = std::uint64_t;
    using Clock = std::chrono::steady_clock;

    struct InFlightRun {
        RunId id = 0;
        NodeId node_id;
        Epoch epoch = 0;
        CancellationToken cancellation;
        std::optional<Clock::time_point> deadline;
        std::chrono::milliseconds timeout{0};
        // failure already reported; the admission stays held until the worker returns
        bool timed_out = false;
        std::string error;
    };

    struct Completion {
        RunId run_id = 0;
        NodeId node_id;
        HandlerResult result;
    };

    std::shared_ptr<const ExecutableDiagram> diagram_;
    const HandlerRegistry& handlers_;
    Config config_;
    TokenManager tokens_;
    RuntimeState state_;
    std::vector<ExecutionObserver*> observers_;

    CancellationToken run_cancel_;
    std::atomic<bool> started_{false};
    std::shared_ptr<const nlohmann::json> run_inputs_;
    RunId next_run_id_ = 1;
    std::unordered_map<RunId, InFlightRun> in_flight_;
    Diagnostics diagnostics_;
    nlohmann::json outputs_ = nlohmann::json::object();
    bool draining_ = false;

    CompletionChannel<Completion> channel_;

    std::size_t dispatch_ready(WorkerPool& pool);
    void dispatch(WorkerPool& pool, const Node& node, PortMap inputs, Epoch epoch);
    void handle_completion(Completion completion);
    void fail_node(const InFlightRun& run, const std::string& error);
    void report_failure(const InFlightRun& run, const std::string& error);
    void advance_loop(const DeferredToken& deferred);
    void expire_timed_out_runs();
    void cancel_in_flight(const std::string& reason);

    bool loop_exhausted(const LoopInfo& loop) const;
    bool loop_exhausted_for(const NodeId& node_id) const;
    bool endpoints_done() const;
    std::chrono::milliseconds next_wait(std::optional<Clock::time_point> run_deadline) const;
    void warn(const std::string& message, std::optional<NodeId> node = std::nullopt);

    ExecutionResult build_result(RunStatus status, Clock::time_point started_at);
};

} // namespace tokenflow

#endif // TOKENFLOW_MODULES_SCHEDULER_SCHEDULER_H
