#include "modules/scheduler/scheduler.h"
#include "core/types/errors.h"
#include "common/logging/logger.h"
#include <algorithm>
#include <stdexcept>

namespace tokenflow {

namespace {

std::string generate_execution_id() {
    static std::atomic<std::uint64_t> counter{0};
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "exec-" + std::to_string(ms) + "-" + std::to_string(++counter);
}

} // namespace

std::string to_string(RunStatus status) {
    switch (status) {
        case RunStatus::COMPLETED: return "completed";
        case RunStatus::FAILED: return "failed";
        case RunStatus::CANCELLED: return "cancelled";
        case RunStatus::TIMED_OUT: return "timed_out";
    }
    return "unknown";
}

nlohmann::json ExecutionResult::to_json() const {
    nlohmann::json j;
    j["success"] = success;
    j["message"] = message;
    j["status"] = to_string(status);
    j["execution_id"] = execution_id;
    j["final_epoch"] = final_epoch;
    j["duration_ms"] = duration.count();
    j["outputs"] = outputs;
    j["nodes"] = nlohmann::json::object();
    for (const auto& [id, outcome] : nodes) {
        j["nodes"][id] = {
            {"status", to_string(outcome.status)},
            {"execution_count", outcome.execution_count},
            {"error", outcome.error ? nlohmann::json(*outcome.error) : nlohmann::json(nullptr)}
        };
    }
    j["diagnostics"] = nlohmann::json::array();
    for (const auto& d : diagnostics) {
        j["diagnostics"].push_back(tokenflow::to_json(d));
    }
    return j;
}

Scheduler::Scheduler(std::shared_ptr<const ExecutableDiagram> diagram, const HandlerRegistry& handlers)
    : Scheduler(std::move(diagram), handlers, Config()) {}

Scheduler::Scheduler(std::shared_ptr<const ExecutableDiagram> diagram, const HandlerRegistry& handlers, Config config)
    : diagram_(std::move(diagram)),
      handlers_(handlers),
      config_(std::move(config)),
      tokens_(diagram_),
      state_(*diagram_) {
    if (config_.max_workers < 1) {
        throw std::invalid_argument("Scheduler requires max_workers >= 1");
    }
    if (config_.execution_id.empty()) {
        config_.execution_id = generate_execution_id();
    }
}

void Scheduler::add_observer(ExecutionObserver* observer) {
    if (observer) observers_.push_back(observer);
}

void Scheduler::cancel() {
    run_cancel_.cancel();
    channel_.notify();
}

ExecutionResult Scheduler::run(nlohmann::json initial_inputs) {
    if (started_.exchange(true)) {
        throw std::logic_error("Scheduler::run may only be called once");
    }
    run_inputs_ = std::make_shared<const nlohmann::json>(std::move(initial_inputs));

    const auto started_at = Clock::now();
    std::optional<Clock::time_point> run_deadline;
    if (config_.run_timeout) run_deadline = started_at + *config_.run_timeout;

    SPDLOG_LOGGER_INFO(logger(), "Run {} started: {} nodes, {} workers",
                       config_.execution_id, diagram_->nodes().size(), config_.max_workers);

    RunStatus status = RunStatus::COMPLETED;
    WorkerPool pool(config_.max_workers);
    try {
        while (true) {
            if (run_cancel_.is_cancelled()) {
                status = RunStatus::CANCELLED;
                break;
            }
            if (run_deadline && Clock::now() >= *run_deadline) {
                status = RunStatus::TIMED_OUT;
                break;
            }
            if (!draining_ && config_.stop_when_endpoints_complete && endpoints_done()) {
                SPDLOG_LOGGER_DEBUG(logger(), "All endpoints completed, draining {} runs", in_flight_.size());
                draining_ = true;
            }

            const std::size_t dispatched = draining_ ? 0 : dispatch_ready(pool);
            if (in_flight_.empty()) {
                if (dispatched > 0) continue; // synchronous failures may have published error tokens
                break;                        // quiescence
            }

            if (auto completion = channel_.pop_for(next_wait(run_deadline))) {
                handle_completion(std::move(*completion));
                for (auto& more : channel_.drain()) {
                    handle_completion(std::move(more));
                }
            }
            expire_timed_out_runs();
        }
    } catch (const SchedulerInvariantError& e) {
        SPDLOG_LOGGER_ERROR(logger(), "Run {} aborted: {}", config_.execution_id, e.what());
        run_cancel_.cancel();
        pool.wait();
        throw;
    }

    if (status == RunStatus::CANCELLED) {
        cancel_in_flight("run cancelled");
    } else if (status == RunStatus::TIMED_OUT) {
        cancel_in_flight("run timed out");
    }
    pool.wait();
    channel_.drain(); // results of cancelled runs are ignored

    ExecutionResult result = build_result(status, started_at);
    SPDLOG_LOGGER_INFO(logger(), "Run {} finished: {} ({} ms, final epoch {})", result.execution_id,
                       to_string(result.status), result.duration.count(), result.final_epoch);
    for (auto* observer : observers_) {
        observer->on_run_complete(result);
    }
    return result;
}

std::size_t Scheduler::dispatch_ready(WorkerPool& pool) {
    std::size_t dispatched = 0;
    const Epoch epoch = tokens_.current_epoch();
    for (const auto& id : diagram_->topological_order()) {
        const Node& node = diagram_->node(id);
        const bool source = diagram_->incoming(id).empty();
        while (true) {
            const NodeRuntime runtime = state_.get(id);
            if (source && runtime.execution_count > 0) break;  // sources run once
            if (node.max_iteration && runtime.execution_count >= *node.max_iteration) break;
            if (!tokens_.has_new_inputs(id, epoch, node.join_policy)) break;
            if (!state_.try_admit(id, node.concurrency_policy)) break;

            PortMap inputs = tokens_.consume_inbound(id, epoch);
            if (!source && inputs.empty()) {
                state_.cancel_admission(id);
                throw SchedulerInvariantError("node '" + id + "' was ready at epoch " + std::to_string(epoch) +
                                              " but claimed no inputs");
            }
            dispatch(pool, node, std::move(inputs), epoch);
            ++dispatched;
            if (source) break;
        }
    }
    return dispatched;
}

void Scheduler::dispatch(WorkerPool& pool, const Node& node, PortMap inputs, Epoch epoch) {
    const int number = state_.begin_run(node.id, node.concurrency_policy);

    InFlightRun run;
    run.id = next_run_id_++;
    run.node_id = node.id;
    run.epoch = epoch;
    run.cancellation = run_cancel_.child();
    if (node.timeout_ms) {
        run.timeout = std::chrono::milliseconds(*node.timeout_ms);
    } else if (config_.default_node_timeout) {
        run.timeout = *config_.default_node_timeout;
    }
    if (run.timeout.count() > 0) {
        run.deadline = Clock::now() + run.timeout;
    }

    RunContext context;
    context.execution_id = config_.execution_id;
    context.node_id = node.id;
    context.epoch = epoch;
    context.execution_number = number;
    context.cancellation = run.cancellation;
    context.deadline = run.deadline;
    context.run_inputs = run_inputs_;
    context.loop_exhausted = loop_exhausted_for(node.id);
    for (EdgeIndex index : diagram_->incoming(node.id)) {
        const ExecutableEdge& edge = diagram_->edge(index);
        if (inputs.count(edge.edge.target_port)) {
            context.input_transforms[edge.edge.target_port] = edge.transform;
        }
    }

    in_flight_.emplace(run.id, run);
    SPDLOG_LOGGER_DEBUG(logger(), "dispatch {} #{} at epoch {} ({} inputs)", node.id, number, epoch, inputs.size());
    for (auto* observer : observers_) {
        observer->on_node_start(node.id, node.type, epoch, number);
    }

    std::shared_ptr<Handler> handler;
    try {
        handler = handlers_.handler_for(node.type);
    } catch (const HandlerNotFound& e) {
        in_flight_.erase(run.id);
        fail_node(run, e.what());
        return;
    }

    pool.submit([this, handler, &node, inputs = std::move(inputs), context = std::move(context), run_id = run.id] {
        Completion completion;
        completion.run_id = run_id;
        completion.node_id = node.id;
        try {
            completion.result = handler->execute(inputs, node.config, context);
        } catch (const std::exception& e) {
            completion.result = HandlerResult::failure(std::string("Handler threw: ") + e.what());
        } catch (...) {
            completion.result = HandlerResult::failure("Handler threw a non-standard exception");
        }
        channel_.push(std::move(completion));
    });
}

void Scheduler::handle_completion(Completion completion) {
    auto it = in_flight_.find(completion.run_id);
    if (it == in_flight_.end()) {
        SPDLOG_LOGGER_DEBUG(logger(), "late result of {} ignored", completion.node_id);
        return;
    }
    const InFlightRun run = std::move(it->second);
    in_flight_.erase(it);

    if (run.timed_out) {
        state_.fail_run(run.node_id, run.error);
        SPDLOG_LOGGER_DEBUG(logger(), "result of timed out {} ignored", run.node_id);
        return;
    }
    if (state_.armed_epoch(run.node_id) > run.epoch) {
        state_.discard_run(run.node_id);
        warn("Discarded result of '" + run.node_id + "' from epoch " + std::to_string(run.epoch) +
                 ": node was re-armed by a loop",
             run.node_id);
        return;
    }
    if (!completion.result.success) {
        fail_node(run, completion.result.message.empty() ? "Handler reported failure" : completion.result.message);
        return;
    }

    EmitResult emitted;
    try {
        emitted = tokens_.emit_outputs(run.node_id, completion.result.outputs, tokens_.current_epoch());
    } catch (const std::invalid_argument& e) {
        fail_node(run, e.what());
        return;
    }
    state_.complete_run(run.node_id);

    const Node& node = diagram_->node(run.node_id);
    if (node.type == NodeType::ENDPOINT) {
        nlohmann::json result = nlohmann::json::object();
        for (const auto& [port, payload] : completion.result.outputs) {
            if (payload) result[port] = *payload;
        }
        outputs_[node.id] = std::move(result);
    }
    SPDLOG_LOGGER_DEBUG(logger(), "{} completed: {} tokens published, {} deferred", run.node_id,
                        emitted.published.size(), emitted.deferred.size());
    for (auto* observer : observers_) {
        observer->on_node_complete(run.node_id, run.epoch, completion.result.outputs);
    }
    for (const auto& deferred : emitted.deferred) {
        advance_loop(deferred);
    }
}

void Scheduler::fail_node(const InFlightRun& run, const std::string& error) {
    state_.fail_run(run.node_id, error);
    report_failure(run, error);
}

// observers, then the error port or an ERROR diagnostic; does not touch the admission
void Scheduler::report_failure(const InFlightRun& run, const std::string& error) {
    SPDLOG_LOGGER_WARN(logger(), "Node {} failed: {}", run.node_id, error);
    for (auto* observer : observers_) {
        observer->on_node_failed(run.node_id, run.epoch, error);
    }

    const auto& ports = diagram_->outgoing_by_port(run.node_id);
    if (!ports.count(std::string(kErrorPort))) {
        diagnostics_.push_back({DiagnosticPhase::EXECUTION, Severity::ERROR, error, run.node_id, std::nullopt});
        return;
    }

    PortMap outputs;
    outputs[std::string(kErrorPort)] = make_envelope({
        {"error", error},
        {"node_id", run.node_id},
        {"epoch", run.epoch}
    });
    const EmitResult emitted = tokens_.emit_outputs(run.node_id, outputs, tokens_.current_epoch());
    diagnostics_.push_back({DiagnosticPhase::EXECUTION, Severity::WARNING,
                            "Failure routed to error port: " + error, run.node_id, std::nullopt});
    for (const auto& deferred : emitted.deferred) {
        advance_loop(deferred);
    }
}

void Scheduler::advance_loop(const DeferredToken& deferred) {
    const ExecutableEdge& edge = diagram_->edge(deferred.edge);
    const LoopInfo* loop = diagram_->loop_for_edge(deferred.edge);
    if (!loop) {
        warn("Loop-back token on " + to_string(edge.edge) + " dropped: no loop recorded", edge.edge.source);
        return;
    }
    if (loop_exhausted(*loop)) {
        warn("Loop " + loop->head + " .. " + loop->tail + " exhausted; loop-back token dropped", loop->tail);
        return;
    }
    if (tokens_.current_epoch() >= config_.max_epochs) {
        warn("max_epochs (" + std::to_string(config_.max_epochs) + ") reached; loop-back token dropped", loop->tail);
        return;
    }

    const Epoch from = tokens_.current_epoch();
    const Epoch to = tokens_.begin_epoch();
    // intra-loop tokens of the finished iteration are dropped, everything else moves along
    const std::size_t carried = tokens_.carry_forward(from, to, [loop](const ExecutableEdge& e) {
        return !(loop->contains(e.edge.source) && loop->contains(e.edge.target));
    });
    // inputs from outside the loop were consumed by the last iteration; members that wait on
    // every input see their latest value again
    const std::size_t replayed = tokens_.replay_latest(from, to, [this, loop](const ExecutableEdge& e) {
        return !e.loop_back && !loop->contains(e.edge.source) && loop->contains(e.edge.target) &&
               diagram_->node(e.edge.target).join_policy.kind != JoinPolicy::Kind::ANY;
    });
    for (const auto& member : loop->members) {
        state_.rearm(member, to);
    }
    tokens_.publish_token(deferred.edge, deferred.payload, to);

    SPDLOG_LOGGER_INFO(logger(), "Epoch {} begins at {} ({} tokens carried, {} replayed)", to, loop->head,
                       carried, replayed);
    for (auto* observer : observers_) {
        observer->on_epoch_begin(to, loop->head);
    }
}

void Scheduler::expire_timed_out_runs() {
    const auto now = Clock::now();
    std::vector<InFlightRun> expired;
    for (auto& [id, run] : in_flight_) {
        if (run.timed_out || !run.deadline || *run.deadline > now) continue;
        run.timed_out = true;
        run.error = "Node '" + run.node_id + "' timed out after " + std::to_string(run.timeout.count()) + " ms";
        run.cancellation.cancel();
        expired.push_back(run);
    }
    // handlers cancel cooperatively, so the slot is released in handle_completion
    for (const auto& run : expired) {
        report_failure(run, run.error);
    }
}

void Scheduler::cancel_in_flight(const std::string& reason) {
    for (auto& [id, run] : in_flight_) {
        run.cancellation.cancel();
        if (run.timed_out) {
            state_.fail_run(run.node_id, run.error);
            continue;
        }
        state_.fail_run(run.node_id, reason);
        for (auto* observer : observers_) {
            observer->on_node_failed(run.node_id, run.epoch, reason);
        }
    }
    in_flight_.clear();
}

bool Scheduler::loop_exhausted(const LoopInfo& loop) const {
    bool bounded = false;
    for (const auto& member : loop.members) {
        const Node& node = diagram_->node(member);
        if (!node.max_iteration) continue;
        bounded = true;
        if (state_.execution_count(member) < *node.max_iteration) return false;
    }
    return bounded;
}

bool Scheduler::loop_exhausted_for(const NodeId& node_id) const {
    for (const LoopInfo* loop : diagram_->loops_containing(node_id)) {
        if (loop_exhausted(*loop)) return true;
    }
    return false;
}

bool Scheduler::endpoints_done() const {
    const auto endpoints = diagram_->endpoints();
    if (endpoints.empty()) return false;
    return std::all_of(endpoints.begin(), endpoints.end(),
                       [this](const NodeId& id) { return state_.get(id).completed > 0; });
}

std::chrono::milliseconds Scheduler::next_wait(std::optional<Clock::time_point> run_deadline) const {
    const auto now = Clock::now();
    auto wait = config_.poll_interval;
    auto shorten = [&](Clock::time_point deadline) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        wait = std::min(wait, left);
    };
    if (run_deadline) shorten(*run_deadline);
    for (const auto& [id, run] : in_flight_) {
        if (run.deadline && !run.timed_out) shorten(*run.deadline);
    }
    return std::max(wait, std::chrono::milliseconds(1));
}

void Scheduler::warn(const std::string& message, std::optional<NodeId> node) {
    SPDLOG_LOGGER_WARN(logger(), "{}", message);
    diagnostics_.push_back({DiagnosticPhase::EXECUTION, Severity::WARNING, message, std::move(node), std::nullopt});
}

ExecutionResult Scheduler::build_result(RunStatus status, Clock::time_point started_at) {
    state_.finalize();

    ExecutionResult result;
    result.execution_id = config_.execution_id;
    result.status = status;
    result.final_epoch = tokens_.current_epoch();
    result.diagnostics = diagnostics_;
    result.outputs = outputs_;
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started_at);
    for (const auto& [id, runtime] : state_.all()) {
        result.nodes[id] = NodeOutcome{runtime.status, runtime.execution_count, runtime.last_error};
    }

    if (status == RunStatus::COMPLETED && has_errors(diagnostics_)) {
        result.status = RunStatus::FAILED;
    }
    result.success = result.status == RunStatus::COMPLETED;
    switch (result.status) {
        case RunStatus::COMPLETED:
            result.message = "Execution completed";
            break;
        case RunStatus::FAILED: {
            std::size_t failures = 0;
            for (const auto& d : diagnostics_) {
                if (d.is_error()) ++failures;
            }
            result.message = "Execution finished with " + std::to_string(failures) + " node failure(s)";
            break;
        }
        case RunStatus::CANCELLED:
            result.message = "Execution cancelled";
            break;
        case RunStatus::TIMED_OUT:
            result.message = "Execution timed out";
            break;
    }
    return result;
}

nlohmann::json Scheduler::snapshot() const {
    nlohmann::json state;
    state["execution_id"] = config_.execution_id;
    state["tokens"] = tokens_.snapshot();
    state["runtime"] = state_.snapshot();
    state["outputs"] = outputs_;
    return state;
}

void Scheduler::restore(const nlohmann::json& state) {
    if (started_) {
        throw std::logic_error("Scheduler::restore must be called before run()");
    }
    if (!state.is_object() || !state.contains("tokens") || !state.contains("runtime")) {
        throw std::invalid_argument("Scheduler snapshot requires 'tokens' and 'runtime'");
    }
    tokens_.restore(state.at("tokens"));
    state_.restore(state.at("runtime"));
    outputs_ = state.value("outputs", nlohmann::json::object());
}

} // namespace tokenflow
